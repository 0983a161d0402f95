// value.cpp - Value hashing, identity and printing

#include <editscript/value.h>

#include <functional>
#include <sstream>

namespace editscript {

namespace {

constexpr std::size_t hash_seed = 0x9e3779b97f4a7c15ull;

inline std::size_t hash_combine(std::size_t seed, std::size_t h)
{
    return seed ^ (h + hash_seed + (seed << 6) + (seed >> 2));
}

// immer containers sharing a root hold the same elements
template <typename Champ>
bool same_champ(const Champ& a, const Champ& b)
{
    return a.impl().root == b.impl().root && a.impl().size == b.impl().size;
}

template <typename Rbts>
bool same_rbts(const Rbts& a, const Rbts& b)
{
    return a.impl().root == b.impl().root &&
           a.impl().tail == b.impl().tail &&
           a.impl().size == b.impl().size;
}

template <typename Seq>
void write_sequence(std::ostringstream& oss, const Seq& seq, const char* open, const char* close)
{
    oss << open;
    bool first = true;
    for (const auto& box : seq) {
        if (!first) oss << " ";
        first = false;
        oss << value_to_string(*box);
    }
    oss << close;
}

} // anonymous namespace

std::size_t value_box_hash::operator()(const ValueBox& box) const
{
    return hash_value(*box);
}

std::size_t hash_value(const Value& val)
{
    const std::size_t kind = val.data.index();
    return std::visit([kind](const auto& arg) -> std::size_t {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return hash_combine(kind, 0);
        } else if constexpr (std::is_same_v<T, Keyword>) {
            return hash_combine(kind, std::hash<std::string>{}(arg.name));
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            // Sum of entry hashes: independent of iteration order
            std::size_t sum = 0;
            for (const auto& [k, v] : arg) {
                sum += hash_combine(std::hash<std::string>{}(k), hash_value(*v));
            }
            return hash_combine(kind, sum);
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            std::size_t sum = 0;
            for (const auto& elem : arg) {
                sum += hash_value(*elem);
            }
            return hash_combine(kind, sum);
        } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueList>) {
            std::size_t seed = hash_combine(kind, arg.size());
            for (const auto& elem : arg) {
                seed = hash_combine(seed, hash_value(*elem));
            }
            return seed;
        } else {
            return hash_combine(kind, std::hash<T>{}(arg));
        }
    }, val.data);
}

bool is_identical(const Value& a, const Value& b)
{
    if (&a == &b) {
        return true;
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueMap> || std::is_same_v<T, ValueSet>) {
            return same_champ(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueList>) {
            return same_rbts(lhs, rhs);
        } else {
            // Scalars have no identity apart from their value
            return lhs == rhs;
        }
    }, a.data);
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            auto s = oss.str();
            // Keep doubles distinguishable from integers
            if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
            return s;
        } else if constexpr (std::is_same_v<T, Keyword>) {
            return ":" + arg.name;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            std::ostringstream oss;
            oss << "{";
            bool first = true;
            for (const auto& [k, v] : arg) {
                if (!first) oss << ", ";
                first = false;
                oss << "\"" << k << "\" " << value_to_string(*v);
            }
            oss << "}";
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            std::ostringstream oss;
            write_sequence(oss, arg, "[", "]");
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueList>) {
            std::ostringstream oss;
            write_sequence(oss, arg, "(", ")");
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            std::ostringstream oss;
            write_sequence(oss, arg, "#{", "}");
            return oss.str();
        } else {
            return "nil";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    std::visit(
        [&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueMap>) {
                std::cout << indent << prefix << "{\n";
                for (const auto& [k, v] : arg) {
                    print_value(*v, k + ": ", depth + 1);
                }
                std::cout << indent << "}\n";
            } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueList>) {
                const bool is_list = std::is_same_v<T, ValueList>;
                std::cout << indent << prefix << (is_list ? "(\n" : "[\n");
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    print_value(*arg[i], "[" + std::to_string(i) + "] ", depth + 1);
                }
                std::cout << indent << (is_list ? ")\n" : "]\n");
            } else if constexpr (std::is_same_v<T, ValueSet>) {
                std::cout << indent << prefix << "#{\n";
                for (const auto& elem : arg) {
                    print_value(*elem, "", depth + 1);
                }
                std::cout << indent << "}\n";
            } else {
                std::cout << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

} // namespace editscript
