#include "site.hpp"
#include "collection.hpp"
#include "config.hpp"
#include "file.hpp"
#include "render.hpp"
#include "reporter.hpp"
#include "template.hpp"

void Site::Build(const Config_& config, const Reporter_& reporter) {
    reporter.Info("Building from " + config.sourceDir_ + " to " + config.destDir_);
    File::MakeDirs(config.destDir_);
    Template::Library_ templates;
    templates.Load(Config::TemplatesDir(config), reporter);

    const std::string assets = Config::AssetsDir(config);
    if (File::IsDirectory(assets)) {
        const int n = File::CopyTree(assets, config.destDir_, reporter);
        reporter.Info("Copied " + std::to_string(n) + " assets");
    } else
        reporter.Debug("No assets in " + assets);

    // complete and sorted before anything is rendered
    const Collection_ posts = Collection::Assemble(config, reporter);
    const TagIndex_ index = Collection::IndexTags(posts);
    Render::All(posts, index, templates, config, reporter);
    reporter.Info("Finished " + config.destDir_);
}

void Site::Clean(const Config_& config, const Reporter_& reporter) {
    reporter.Info("Cleaning build directory: " + config.destDir_);
    File::RemoveAll(config.destDir_);
}
