#include "atom.hpp"
#include "file.hpp"
#include "parseutils.hpp"

using ParseUtils::XmlSafe;

void Atom::Write(const Collection_& posts, std::ostream& dst) {
    dst << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        << "<feed xmlns=\"http://www.w3.org/2005/Atom\">\n";
    for (const auto& post : posts) {
        dst << "  <entry>\n";
        if (auto title = Post::Get(*post, Post::TITLE))
            dst << "    <title>" << XmlSafe(*title) << "</title>\n";
        if (auto date = Post::Get(*post, Post::DATE))
            dst << "    <published>" << XmlSafe(*date) << "</published>\n";
        if (auto url = Post::Get(*post, Post::URL))
            dst << "    <link href=\"" << XmlSafe(*url) << "\" />\n";
        dst << "  </entry>\n";
    }
    dst << "</feed>\n";
}

void Atom::WriteFile(const Collection_& posts, const std::string& filename) {
    std::ofstream dst;
    File::Create(filename, &dst);
    Write(posts, dst);
    dst.flush();
    if (!dst)
        throw IoError_("Can't write '" + filename + "'");
}
