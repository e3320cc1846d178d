#pragma once

struct Config_;
class Reporter_;

namespace Site {
    // copy assets, assemble posts, then render every page and feed
    void Build(const Config_& config, const Reporter_& reporter);
    // removes the destination directory
    void Clean(const Config_& config, const Reporter_& reporter);
} // namespace Site
