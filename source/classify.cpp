// classify.cpp - Value category dispatch

#include <editscript/classify.h>

namespace editscript {

ValueKind classify(const Value& v) noexcept
{
    return std::visit([](const auto& arg) -> ValueKind {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return ValueKind::Absent;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return ValueKind::Map;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return ValueKind::Sequence;
        } else if constexpr (std::is_same_v<T, ValueList>) {
            return ValueKind::List;
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            return ValueKind::Set;
        } else {
            static_assert(std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                              std::is_same_v<T, double> || std::is_same_v<T, std::string> ||
                              std::is_same_v<T, Keyword>,
                          "unclassified Value alternative");
            return ValueKind::Scalar;
        }
    }, v.data);
}

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Absent:   return "absent";
        case ValueKind::Map:      return "map";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::List:     return "list";
        case ValueKind::Set:      return "set";
        case ValueKind::Scalar:   return "scalar";
    }
    return "unknown";
}

} // namespace editscript
