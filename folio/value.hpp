#ifndef FOLIO_VALUE__
#define FOLIO_VALUE__

#include "handle.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace YAML {
    class Node;
}

/* Value_ is the dynamically-typed tree which holds front matter and the fields derived from it.
   A number keeps the subkind it was given at construction; maps iterate in key order, so anything
   serialized from a Value_ is deterministic.
*/

struct Null_ {};
inline bool operator==(const Null_&, const Null_&) { return true; }
inline bool operator!=(const Null_&, const Null_&) { return false; }

using Number_ = std::variant<std::int64_t, double>;

struct Value_;
using Array_ = std::vector<Value_>;
using Map_ = std::map<std::string, Value_>;

struct Value_ {
    using Store_ = std::variant<Null_, bool, Number_, std::string, Array_, Map_>;
    Store_ val_;

    Value_() : val_(Null_()) {}
    Value_(Null_ n) : val_(n) {}
    Value_(bool b) : val_(b) {}
    Value_(int i) : val_(Number_(static_cast<std::int64_t>(i))) {}
    Value_(std::int64_t i) : val_(Number_(i)) {}
    Value_(double f) : val_(Number_(f)) {}
    Value_(const char* s) : val_(std::string(s)) {}
    Value_(std::string s) : val_(std::move(s)) {}
    Value_(Array_ a) : val_(std::move(a)) {}
    Value_(Map_ m) : val_(std::move(m)) {}

    bool IsNull() const { return std::holds_alternative<Null_>(val_); }
    // the wrapped string, or nothing for any other kind
    std::optional<std::string> AsString() const;
    const Array_* AsArray() const { return std::get_if<Array_>(&val_); }
    const Map_* AsMap() const { return std::get_if<Map_>(&val_); }
};

bool operator==(const Value_& lhs, const Value_& rhs);
inline bool operator!=(const Value_& lhs, const Value_& rhs) { return !(lhs == rhs); }

namespace Value {
    // conversion from yaml-cpp; throws UnrepresentableNumber_ for numerals that fit neither int64 nor double
    Value_ FromYaml(const YAML::Node& node);
    // decodes one YAML document; yaml-cpp failures become DecodeError_
    Value_ ParseYaml(const std::string& text);

    // Null is written as '~'; a float always reads back as a float, though NaN never compares equal
    std::string ToYaml(const Value_& value);
    nlohmann::json ToJson(const Value_& value); // data context for the template engine

    std::string Describe(const Value_& value); // kind name, for messages
} // namespace Value

#endif
