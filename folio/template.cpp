#include "template.hpp"
#include "date.hpp"
#include "file.hpp"
#include "reporter.hpp"
#include <inja/inja.hpp>
#include <map>
#include <sstream>

const std::string Template::SUFFIX(".html.inja");

namespace {
    const std::string DEFAULT_DATE_PATTERN("%c");
    const std::string DEFAULT_SEPARATOR(", ");

    std::string StringArg(const inja::Arguments& args, size_t which, const std::string& fallback) {
        if (which >= args.size() || args[which]->is_null())
            return fallback;
        if (!args[which]->is_string())
            throw TemplateError_("Argument " + std::to_string(which + 1) + " must be a string");
        return args[which]->get<std::string>();
    }

    nlohmann::json FormatDateTime(const inja::Arguments& args) {
        if (args.empty() || !args[0]->is_string())
            throw TemplateError_("Property cannot be converted to string.");
        const std::string value = args[0]->get<std::string>();
        if (!Date::Parse(value))
            throw TemplateError_("Could not parse as datetime: " + value);
        return Date::Format(value, StringArg(args, 1, DEFAULT_DATE_PATTERN));
    }

    nlohmann::json Join(const inja::Arguments& args) {
        if (args.empty() || !args[0]->is_array())
            throw TemplateError_("Property cannot be converted to array.");
        const std::string sep = StringArg(args, 1, DEFAULT_SEPARATOR);
        std::string retval;
        bool first = true;
        for (const auto& e : *args[0]) {
            if (!e.is_string())
                continue;
            if (!first)
                retval += sep;
            retval += e.get<std::string>();
            first = false;
        }
        return retval;
    }
} // namespace

struct Template::Library_::Impl_ {
    inja::Environment env_;
    std::map<std::string, inja::Template> templates_;

    Impl_() {
        // includes resolve against registered names at render time, so load order does not matter
        env_.set_search_included_templates_in_files(false);
        env_.add_callback("formatDateTime", 1, [](inja::Arguments& args) { return FormatDateTime(args); });
        env_.add_callback("formatDateTime", 2, [](inja::Arguments& args) { return FormatDateTime(args); });
        env_.add_callback("join", 1, [](inja::Arguments& args) { return Join(args); });
        env_.add_callback("join", 2, [](inja::Arguments& args) { return Join(args); });
    }
};

Template::Library_::Library_() : impl_(new Impl_) {}
Template::Library_::~Library_() = default;

void Template::Library_::Load(const std::string& dir, const Reporter_& reporter) {
    reporter.Info("Registering templates in directory " + dir);
    for (const auto& filename : File::List(dir, ".*\\.html\\.inja")) {
        std::string name = File::RelativeTo(filename, dir);
        name.erase(name.size() - SUFFIX.size());
        reporter.Debug("Template " + name + " from " + filename);
        Add(name, File::Read(filename));
    }
}

void Template::Library_::Add(const std::string& name, const std::string& source) {
    try {
        inja::Template parsed = impl_->env_.parse(source);
        impl_->env_.include_template(name, parsed);
        impl_->templates_.insert_or_assign(name, parsed);
    } catch (const inja::InjaError& e) {
        throw TemplateError_("Template '" + name + "': " + e.what());
    }
}

bool Template::Library_::Has(const std::string& name) const { return impl_->templates_.count(name) > 0; }

std::vector<std::string> Template::Library_::Names() const {
    std::vector<std::string> retval;
    for (const auto& t : impl_->templates_)
        retval.push_back(t.first);
    return retval;
}

void Template::Library_::Render(const std::string& name, const nlohmann::json& data, std::ostream& dst) const {
    auto pt = impl_->templates_.find(name);
    if (pt == impl_->templates_.end())
        throw TemplateError_("Template not found: " + name);
    try {
        impl_->env_.render_to(dst, pt->second, data);
    } catch (const inja::InjaError& e) {
        throw TemplateError_("Rendering '" + name + "': " + e.what());
    }
}

std::string Template::Library_::Render(const std::string& name, const nlohmann::json& data) const {
    std::ostringstream retval;
    Render(name, data, retval);
    return retval.str();
}
