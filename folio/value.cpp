#include "value.hpp"
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <locale>
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>
#include <yaml-cpp/yaml.h>

std::optional<std::string> Value_::AsString() const {
    if (auto ps = std::get_if<std::string>(&val_))
        return *ps;
    return std::nullopt;
}

bool operator==(const Value_& lhs, const Value_& rhs) { return lhs.val_ == rhs.val_; }

namespace {
    static const std::string STR_TAG("tag:yaml.org,2002:str");
    static const std::string NONPLAIN_TAG("!"); // yaml-cpp tags quoted and block scalars this way

    // YAML 1.2 core schema
    enum class Plain_ { NUL, BOOLEAN, DECIMAL, OCTAL, HEX, FLOAT, SPECIAL_FLOAT, STRING };

    Plain_ Classify(const std::string& text) {
        static const std::regex NUL("~|null|Null|NULL|");
        static const std::regex BOOLEAN("true|True|TRUE|false|False|FALSE");
        static const std::regex DECIMAL("[-+]?[0-9]+");
        static const std::regex OCTAL("0o[0-7]+");
        static const std::regex HEX("0x[0-9a-fA-F]+");
        static const std::regex FLOAT("[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?");
        static const std::regex SPECIAL("[-+]?\\.(inf|Inf|INF)|\\.(nan|NaN|NAN)");
        if (std::regex_match(text, NUL))
            return Plain_::NUL;
        if (std::regex_match(text, BOOLEAN))
            return Plain_::BOOLEAN;
        if (std::regex_match(text, DECIMAL))
            return Plain_::DECIMAL;
        if (std::regex_match(text, OCTAL))
            return Plain_::OCTAL;
        if (std::regex_match(text, HEX))
            return Plain_::HEX;
        if (std::regex_match(text, FLOAT))
            return Plain_::FLOAT;
        if (std::regex_match(text, SPECIAL))
            return Plain_::SPECIAL_FLOAT;
        return Plain_::STRING;
    }

    Value_ FromDouble(const std::string& text) {
        errno = 0;
        const double d = std::strtod(text.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(d))
            throw UnrepresentableNumber_(text);
        return Value_(d);
    }

    // digits are already validated against the radix
    Value_ FromRadix(const std::string& text, const std::string& digits, int radix) {
        std::int64_t i = 0;
        auto res = std::from_chars(digits.data(), digits.data() + digits.size(), i, radix);
        if (res.ec == std::errc())
            return Value_(i);
        double d = 0.0;
        for (char c : digits)
            d = d * radix + std::stoi(std::string(1, c), nullptr, 16);
        if (std::isinf(d))
            throw UnrepresentableNumber_(text);
        return Value_(d);
    }

    Value_ FromPlain(const std::string& text) {
        switch (Classify(text)) {
        case Plain_::NUL:
            return Value_();
        case Plain_::BOOLEAN:
            return Value_(text[0] == 't' || text[0] == 'T');
        case Plain_::DECIMAL: {
            const std::string digits = text[0] == '+' ? text.substr(1) : text;
            std::int64_t i = 0;
            auto res = std::from_chars(digits.data(), digits.data() + digits.size(), i);
            if (res.ec == std::errc())
                return Value_(i);
            return FromDouble(text); // too wide for int64
        }
        case Plain_::OCTAL:
            return FromRadix(text, text.substr(2), 8);
        case Plain_::HEX:
            return FromRadix(text, text.substr(2), 16);
        case Plain_::FLOAT:
            return FromDouble(text);
        case Plain_::SPECIAL_FLOAT:
            if (text.find_first_of("nN") != std::string::npos && text.find_first_of("iI") == std::string::npos)
                return Value_(std::numeric_limits<double>::quiet_NaN());
            return Value_(text[0] == '-' ? -std::numeric_limits<double>::infinity()
                                         : std::numeric_limits<double>::infinity());
        case Plain_::STRING:
            break;
        }
        return Value_(text);
    }

    // keeps a point or exponent so the text reads back as a float, sign of zero included
    std::string FloatText(double d) {
        std::ostringstream text;
        text.imbue(std::locale::classic());
        text.precision(std::numeric_limits<double>::max_digits10);
        text << d;
        std::string retval = text.str();
        if (retval.find_first_of(".eE") == std::string::npos)
            retval += ".0";
        return retval;
    }

    bool IsLiteralString(const YAML::Node& node) { return node.Tag() == NONPLAIN_TAG || node.Tag() == STR_TAG; }

    // only keys which resolve to strings survive
    std::optional<std::string> KeyOf(const YAML::Node& key) {
        if (!key.IsScalar())
            return std::nullopt;
        if (IsLiteralString(key) || Classify(key.Scalar()) == Plain_::STRING)
            return key.Scalar();
        return std::nullopt;
    }

    void Emit(YAML::Emitter& out, const Value_& value) {
        std::visit(
            [&out](const auto& v) {
                using T_ = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T_, Null_>)
                    out << YAML::Null;
                else if constexpr (std::is_same_v<T_, bool>)
                    out << v;
                else if constexpr (std::is_same_v<T_, Number_>) {
                    if (auto pi = std::get_if<std::int64_t>(&v))
                        out << static_cast<long long>(*pi);
                    else {
                        const double d = std::get<double>(v);
                        if (std::isnan(d))
                            out << ".nan";
                        else if (std::isinf(d))
                            out << (d < 0 ? "-.inf" : ".inf");
                        else
                            out << FloatText(d);
                    }
                } else if constexpr (std::is_same_v<T_, std::string>)
                    out << YAML::DoubleQuoted << v;
                else if constexpr (std::is_same_v<T_, Array_>) {
                    out << YAML::BeginSeq;
                    for (const auto& e : v)
                        Emit(out, e);
                    out << YAML::EndSeq;
                } else {
                    static_assert(std::is_same_v<T_, Map_>);
                    out << YAML::BeginMap;
                    for (const auto& kv : v) {
                        out << YAML::Key << YAML::DoubleQuoted << kv.first << YAML::Value;
                        Emit(out, kv.second);
                    }
                    out << YAML::EndMap;
                }
            },
            value.val_);
    }
} // namespace

Value_ Value::FromYaml(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return Value_();
    case YAML::NodeType::Scalar:
        // other tags are dropped and the scalar resolved as if plain
        return IsLiteralString(node) ? Value_(node.Scalar()) : FromPlain(node.Scalar());
    case YAML::NodeType::Sequence: {
        Array_ retval;
        retval.reserve(node.size());
        for (const auto& child : node)
            retval.push_back(FromYaml(child));
        return Value_(std::move(retval));
    }
    case YAML::NodeType::Map: {
        Map_ retval;
        for (const auto& kv : node) {
            if (auto key = KeyOf(kv.first))
                retval[*key] = FromYaml(kv.second);
        }
        return Value_(std::move(retval));
    }
    }
    THROW("Unknown YAML node type");
}

Value_ Value::ParseYaml(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw DecodeError_(e.what());
    }
    return FromYaml(root);
}

std::string Value::ToYaml(const Value_& value) {
    YAML::Emitter out;
    Emit(out, value);
    REQUIRE(out.good(), "YAML emission failed: " + out.GetLastError());
    return std::string(out.c_str());
}

nlohmann::json Value::ToJson(const Value_& value) {
    return std::visit(
        [](const auto& v) -> nlohmann::json {
            using T_ = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T_, Null_>)
                return nullptr;
            else if constexpr (std::is_same_v<T_, Number_>)
                return std::visit([](auto n) { return nlohmann::json(n); }, v);
            else if constexpr (std::is_same_v<T_, Array_>) {
                auto retval = nlohmann::json::array();
                for (const auto& e : v)
                    retval.push_back(ToJson(e));
                return retval;
            } else if constexpr (std::is_same_v<T_, Map_>) {
                auto retval = nlohmann::json::object();
                for (const auto& kv : v)
                    retval[kv.first] = ToJson(kv.second);
                return retval;
            } else
                return nlohmann::json(v);
        },
        value.val_);
}

std::string Value::Describe(const Value_& value) {
    static const char* NAMES[] = {"null", "boolean", "number", "string", "array", "map"};
    return NAMES[value.val_.index()];
}
