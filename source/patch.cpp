// patch.cpp - Patch applier

#include <editscript/classify.h>
#include <editscript/errors.h>
#include <editscript/patch.h>

namespace editscript {

namespace {

template <typename Seq>
Seq insert_at(const Seq& seq, std::size_t index, ValueBox box)
{
    if constexpr (std::is_same_v<Seq, ValueList>) {
        return seq.insert(index, std::move(box));
    } else {
        // immer::vector only grows at the end: rebuild the tail
        auto t = seq.take(index).transient();
        t.push_back(std::move(box));
        for (std::size_t i = index; i < seq.size(); ++i) {
            t.push_back(seq[i]);
        }
        return t.persistent();
    }
}

template <typename Seq>
Seq erase_at(const Seq& seq, std::size_t index)
{
    if constexpr (std::is_same_v<Seq, ValueList>) {
        return seq.erase(index);
    } else {
        auto t = seq.take(index).transient();
        for (std::size_t i = index + 1; i < seq.size(); ++i) {
            t.push_back(seq[i]);
        }
        return t.persistent();
    }
}

class OperationApplier {
public:
    OperationApplier(const Operation& op, std::size_t op_index)
        : op_(op)
        , op_index_(op_index)
    {}

    Value apply(const Value& root) const
    {
        if (op_.path.empty()) {
            return op_.type == OpType::Delete ? Value{} : op_.get();
        }
        return apply_recursive(root, 0);
    }

private:
    Value apply_recursive(const Value& node, std::size_t step_index) const
    {
        const PathElement& step = op_.path[step_index];
        if (step_index + 1 == op_.path.size()) {
            return apply_last_step(node, step);
        }
        Value child = child_at(node, step);
        Value new_child = apply_recursive(child, step_index + 1);
        return with_child(node, step, std::move(new_child));
    }

    // Intermediate step: the child must exist
    Value child_at(const Value& node, const PathElement& step) const
    {
        return std::visit([&](const auto& s) -> Value {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, std::string>) {
                auto* m = node.get_if<ValueMap>();
                if (!m) fail(PatchErrorKind::TypeMismatch, "key '" + s + "' on " + describe(node));
                auto* found = m->find(s);
                if (!found) fail(PatchErrorKind::PathNotFound, "no key '" + s + "'");
                return found->get();
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                if (auto* v = node.get_if<ValueVector>()) {
                    if (s >= v->size()) fail(PatchErrorKind::PathNotFound, index_message(s, v->size()));
                    return (*v)[s].get();
                }
                if (auto* l = node.get_if<ValueList>()) {
                    if (s >= l->size()) fail(PatchErrorKind::PathNotFound, index_message(s, l->size()));
                    return (*l)[s].get();
                }
                fail(PatchErrorKind::TypeMismatch, "index on " + describe(node));
            } else {
                auto* set = node.get_if<ValueSet>();
                if (!set) fail(PatchErrorKind::TypeMismatch, "set element on " + describe(node));
                auto* found = set->find(s.value);
                if (!found) fail(PatchErrorKind::PathNotFound, "no element " + value_to_string(*s.value));
                return found->get();
            }
        }, step);
    }

    // Put a modified child back where child_at() found it
    Value with_child(const Value& node, const PathElement& step, Value child) const
    {
        return std::visit([&](const auto& s) -> Value {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return std::get<ValueMap>(node.data).set(s, ValueBox{std::move(child)});
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                if (auto* v = node.get_if<ValueVector>()) {
                    return v->set(s, ValueBox{std::move(child)});
                }
                return std::get<ValueList>(node.data).set(s, ValueBox{std::move(child)});
            } else {
                return std::get<ValueSet>(node.data).erase(s.value).insert(ValueBox{std::move(child)});
            }
        }, step);
    }

    Value apply_last_step(const Value& node, const PathElement& step) const
    {
        return std::visit([&](const auto& s) -> Value {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return apply_to_map(node, s);
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                if (auto* v = node.get_if<ValueVector>()) return Value{apply_to_sequence(*v, s)};
                if (auto* l = node.get_if<ValueList>()) return Value{apply_to_sequence(*l, s)};
                fail(PatchErrorKind::TypeMismatch, "index on " + describe(node));
            } else {
                return apply_to_set(node, s);
            }
        }, step);
    }

    Value apply_to_map(const Value& node, const std::string& key) const
    {
        auto* m = node.get_if<ValueMap>();
        if (!m) fail(PatchErrorKind::TypeMismatch, "key '" + key + "' on " + describe(node));

        if (op_.type == OpType::Add) {
            return m->set(key, op_.value);
        }
        if (!m->count(key)) fail(PatchErrorKind::PathNotFound, "no key '" + key + "'");
        if (op_.type == OpType::Delete) {
            return m->erase(key);
        }
        return m->set(key, op_.value);
    }

    template <typename Seq>
    Seq apply_to_sequence(const Seq& seq, std::size_t index) const
    {
        switch (op_.type) {
            case OpType::Add:
                // Appending at index == size is allowed
                if (index > seq.size()) fail(PatchErrorKind::PathNotFound, index_message(index, seq.size()));
                return insert_at(seq, index, op_.value);
            case OpType::Delete:
                if (index >= seq.size()) fail(PatchErrorKind::PathNotFound, index_message(index, seq.size()));
                return erase_at(seq, index);
            case OpType::Replace:
                if (index >= seq.size()) fail(PatchErrorKind::PathNotFound, index_message(index, seq.size()));
                return seq.set(index, op_.value);
        }
        return seq;
    }

    Value apply_to_set(const Value& node, const SetElement& elem) const
    {
        auto* set = node.get_if<ValueSet>();
        if (!set) fail(PatchErrorKind::TypeMismatch, "set element on " + describe(node));

        if (op_.type == OpType::Add) {
            return set->insert(op_.value);
        }
        if (!set->count(elem.value)) {
            fail(PatchErrorKind::PathNotFound, "no element " + value_to_string(*elem.value));
        }
        if (op_.type == OpType::Delete) {
            return set->erase(elem.value);
        }
        return set->erase(elem.value).insert(op_.value);
    }

    [[noreturn]] void fail(PatchErrorKind kind, const std::string& message) const
    {
        detail::log_access_error("patch", std::string{patch_error_kind_name(kind)} + " at " +
                                              path_to_string(op_.path) + ": " + message);
        throw PatchError(kind, op_.path, op_index_, message);
    }

    static std::string describe(const Value& node)
    {
        return std::string{kind_name(classify(node))};
    }

    static std::string index_message(std::size_t index, std::size_t size)
    {
        return "index " + std::to_string(index) + " out of range (size " + std::to_string(size) + ")";
    }

    const Operation& op_;
    std::size_t op_index_;
};

} // anonymous namespace

Value apply_operation(const Value& root, const Operation& op, std::size_t op_index)
{
    return OperationApplier{op, op_index}.apply(root);
}

Value patch(const Value& a, const EditScript& script)
{
    Value result = a;
    std::size_t op_index = 0;
    for (const auto& op : script.edits()) {
        result = apply_operation(result, op, op_index);
        ++op_index;
    }
    return result;
}

Value patch(const Value& a, const std::optional<EditScript>& script)
{
    if (!script) {
        return a;
    }
    return patch(a, *script);
}

} // namespace editscript
