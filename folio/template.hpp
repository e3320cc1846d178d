#ifndef FOLIO_TEMPLATE__
#define FOLIO_TEMPLATE__

#include "handle.hpp"
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <ostream>

class Reporter_;

/* Templates are inja files named "<name>.html.inja" anywhere under the templates directory; a template is
   known by its path relative to that directory without the suffix, e.g. "partials/nav".  Templates may
   include each other by those names.

   Two helpers are available to every template:
        formatDateTime(date)            formats an ISO-8601 date with strftime "%c"
        formatDateTime(date, pattern)   ... with the given strftime pattern
        join(array)                     joins the string elements with ", "
        join(array, separator)
*/

namespace Template {
    extern const std::string SUFFIX;

    class Library_ {
    public:
        Library_();
        ~Library_();
        Library_(const Library_&) = delete;
        Library_& operator=(const Library_&) = delete;

        void Load(const std::string& dir, const Reporter_& reporter);
        void Add(const std::string& name, const std::string& source);
        bool Has(const std::string& name) const;
        std::vector<std::string> Names() const;

        // TemplateError_ for an unknown name or any engine failure
        void Render(const std::string& name, const nlohmann::json& data, std::ostream& dst) const;
        std::string Render(const std::string& name, const nlohmann::json& data) const;

    private:
        struct Impl_;
        std::unique_ptr<Impl_> impl_;
    };
} // namespace Template

#endif
