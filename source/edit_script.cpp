// edit_script.cpp - EditScript log, counters and logical shape

#include <editscript/edit_script.h>
#include <editscript/errors.h>

#include <sstream>

namespace editscript {

namespace {

constexpr const char* set_element_tag = "#";

Value path_to_value(const Path& path)
{
    auto t = ValueVector{}.transient();
    for (const auto& elem : path) {
        std::visit([&](const auto& step) {
            using T = std::decay_t<decltype(step)>;
            if constexpr (std::is_same_v<T, std::string>) {
                t.push_back(ValueBox{Value{step}});
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                t.push_back(ValueBox{Value{static_cast<int64_t>(step)}});
            } else {
                t.push_back(ValueBox{Value{ValueMap{}.set(set_element_tag, step.value)}});
            }
        }, elem);
    }
    return Value{t.persistent()};
}

PathElement path_element_from_value(const Value& step, std::size_t entry_index)
{
    if (auto* key = step.get_if<std::string>()) {
        return PathElement{*key};
    }
    if (auto* index = step.get_if<int64_t>()) {
        if (*index < 0) {
            throw InvalidScriptError("edit " + std::to_string(entry_index) +
                                     ": negative index in path");
        }
        return PathElement{static_cast<std::size_t>(*index)};
    }
    if (auto* m = step.get_if<ValueMap>()) {
        if (m->size() == 1) {
            if (auto* elem = m->find(set_element_tag)) {
                return PathElement{SetElement{*elem}};
            }
        }
    }
    throw InvalidScriptError("edit " + std::to_string(entry_index) +
                             ": path step " + value_to_string(step) +
                             " is not a key, an index or a set element");
}

Path path_from_value(const Value& path_val, std::size_t entry_index)
{
    auto* steps = path_val.get_if<ValueVector>();
    if (!steps) {
        throw InvalidScriptError("edit " + std::to_string(entry_index) + ": path is not a vector");
    }
    Path path;
    path.reserve(steps->size());
    for (const auto& step : *steps) {
        path.push_back(path_element_from_value(*step, entry_index));
    }
    return path;
}

} // anonymous namespace

// ============================================================
// EditScript
// ============================================================

EditScript::EditScript(Value original)
    : original_(std::move(original))
{}

EditScript::EditScript(const EditScript& other)
{
    std::lock_guard lock(other.mutex_);
    original_ = other.original_;
    edits_ = other.edits_;
    counts_ = other.counts_;
}

EditScript::EditScript(EditScript&& other) noexcept
{
    std::lock_guard lock(other.mutex_);
    original_ = std::move(other.original_);
    edits_ = std::move(other.edits_);
    counts_ = std::exchange(other.counts_, EditCounts{});
}

EditScript& EditScript::operator=(const EditScript& other)
{
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        original_ = other.original_;
        edits_ = other.edits_;
        counts_ = other.counts_;
    }
    return *this;
}

EditScript& EditScript::operator=(EditScript&& other) noexcept
{
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        original_ = std::move(other.original_);
        edits_ = std::move(other.edits_);
        counts_ = std::exchange(other.counts_, EditCounts{});
    }
    return *this;
}

void EditScript::append(OpType type, const Path& path, Value value)
{
    std::lock_guard lock(mutex_);
    switch (type) {
        case OpType::Add:     ++counts_.adds; break;
        case OpType::Delete:  ++counts_.deletes; break;
        case OpType::Replace: ++counts_.replaces; break;
    }
    edits_.push_back(Operation{type, path, ValueBox{std::move(value)}});
}

void EditScript::record_add(const Path& path, Value value)
{
    append(OpType::Add, path, std::move(value));
}

void EditScript::record_delete(const Path& path)
{
    append(OpType::Delete, path, Value{});
}

void EditScript::record_replace(const Path& path, Value value)
{
    append(OpType::Replace, path, std::move(value));
}

std::vector<Operation> EditScript::edits() const
{
    std::lock_guard lock(mutex_);
    return edits_;
}

std::size_t EditScript::distance() const
{
    std::lock_guard lock(mutex_);
    return counts_.adds + counts_.deletes + counts_.replaces;
}

EditCounts EditScript::counts() const
{
    std::lock_guard lock(mutex_);
    return counts_;
}

std::size_t EditScript::adds_num() const
{
    std::lock_guard lock(mutex_);
    return counts_.adds;
}

std::size_t EditScript::deletes_num() const
{
    std::lock_guard lock(mutex_);
    return counts_.deletes;
}

std::size_t EditScript::replaces_num() const
{
    std::lock_guard lock(mutex_);
    return counts_.replaces;
}

std::size_t EditScript::size() const
{
    std::lock_guard lock(mutex_);
    return edits_.size();
}

bool EditScript::empty() const
{
    return size() == 0;
}

// ============================================================
// Logical shape
// ============================================================

Value EditScript::to_value() const
{
    std::lock_guard lock(mutex_);
    auto t = ValueVector{}.transient();
    for (const auto& op : edits_) {
        auto entry = ValueVector{}
                         .push_back(ValueBox{path_to_value(op.path)})
                         .push_back(ValueBox{Value{std::string{op_type_symbol(op.type)}}});
        if (op.type != OpType::Delete) {
            entry = std::move(entry).push_back(op.value);
        }
        t.push_back(ValueBox{Value{std::move(entry)}});
    }
    return Value{t.persistent()};
}

EditScript EditScript::from_value(Value original, const Value& edits)
{
    auto* entries = edits.get_if<ValueVector>();
    if (!entries) {
        throw InvalidScriptError("edit list is not a vector: " + value_to_string(edits));
    }

    EditScript script{std::move(original)};
    for (std::size_t i = 0; i < entries->size(); ++i) {
        const Value& entry = *(*entries)[i];
        auto* fields = entry.get_if<ValueVector>();
        if (!fields || fields->size() < 2 || fields->size() > 3) {
            throw InvalidScriptError("edit " + std::to_string(i) +
                                     " is not [path op] or [path op value]");
        }
        Path path = path_from_value(*(*fields)[0], i);
        const std::string op = (*fields)[1]->as_string();

        if (op == "-" && fields->size() == 2) {
            script.record_delete(path);
        } else if (op == "+" && fields->size() == 3) {
            script.record_add(path, *(*fields)[2]);
        } else if (op == "r" && fields->size() == 3) {
            script.record_replace(path, *(*fields)[2]);
        } else {
            throw InvalidScriptError("edit " + std::to_string(i) + ": bad operation " +
                                     value_to_string(*(*fields)[1]));
        }
    }
    return script;
}

// ============================================================
// Printing
// ============================================================

std::string_view op_type_symbol(OpType type) noexcept
{
    switch (type) {
        case OpType::Add:     return "+";
        case OpType::Delete:  return "-";
        case OpType::Replace: return "r";
    }
    return "?";
}

std::string_view op_type_to_string(OpType type) noexcept
{
    switch (type) {
        case OpType::Add:     return "ADD";
        case OpType::Delete:  return "DELETE";
        case OpType::Replace: return "REPLACE";
    }
    return "UNKNOWN";
}

std::string edit_script_to_string(const EditScript& script)
{
    std::ostringstream oss;
    for (const auto& op : script.edits()) {
        oss << op_type_symbol(op.type) << " " << path_to_string(op.path);
        if (op.type != OpType::Delete) {
            oss << " " << value_to_string(op.get());
        }
        oss << "\n";
    }
    return oss.str();
}

void print_edits(const EditScript& script)
{
    const auto ops = script.edits();
    if (ops.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& op : ops) {
        std::cout << "  " << op_type_to_string(op.type) << " " << path_to_string(op.path);
        if (op.type != OpType::Delete) {
            std::cout << ": " << value_to_string(op.get());
        }
        std::cout << "\n";
    }
}

} // namespace editscript
