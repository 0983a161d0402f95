// value_diff.cpp - Structural differ

#include <editscript/classify.h>
#include <editscript/errors.h>
#include <editscript/sequence_aligner.h>
#include <editscript/value_diff.h>

namespace editscript {

namespace {

class StructuralDiffer {
public:
    StructuralDiffer(const Value& original, const DiffOptions& options)
        : options_(options)
        , script_(original)
    {
        path_.reserve(16);
    }

    void run(const Value* a, const Value* b) { diff_at(a, b, 0); }

    EditScript take() { return std::move(script_); }

private:
    // Null `a` or `b` means that side is absent at path_
    void diff_at(const Value* a, const Value* b, std::size_t depth)
    {
        if (depth > options_.max_depth) [[unlikely]] {
            throw DepthLimitError(path_, options_.max_depth);
        }
        if (options_.trace) {
            options_.trace(DiffTraceEvent{path_, a, b, depth});
        }

        if (!a) {
            if (b) script_.record_add(path_, *b);
            return;
        }
        if (!b) {
            script_.record_delete(path_);
            return;
        }
        if (is_identical(*a, *b)) [[likely]] {
            return;
        }

        const ValueKind kind = classify(*a);
        if (kind == classify(*b)) {
            switch (kind) {
                case ValueKind::Map:
                    diff_map(std::get<ValueMap>(a->data), std::get<ValueMap>(b->data), depth);
                    return;
                case ValueKind::Sequence:
                    diff_sequence(std::get<ValueVector>(a->data), std::get<ValueVector>(b->data), depth);
                    return;
                case ValueKind::List:
                    diff_sequence(std::get<ValueList>(a->data), std::get<ValueList>(b->data), depth);
                    return;
                case ValueKind::Set:
                    diff_set(std::get<ValueSet>(a->data), std::get<ValueSet>(b->data));
                    return;
                case ValueKind::Absent:
                case ValueKind::Scalar:
                    break;
            }
        }

        if (*a != *b) {
            script_.record_replace(path_, *b);
        }
    }

    void diff_map(const ValueMap& a, const ValueMap& b, std::size_t depth)
    {
        // A key holding null is present: membership decides, not the lookup result
        for (const auto& [key, a_box] : a) {
            const ValueBox* b_box = b.find(key);
            path_.push_back(key);
            diff_at(&a_box.get(), b_box ? &b_box->get() : nullptr, depth + 1);
            path_.pop_back();
        }
        for (const auto& [key, b_box] : b) {
            if (a.count(key)) continue;
            path_.push_back(key);
            diff_at(nullptr, &b_box.get(), depth + 1);
            path_.pop_back();
        }
    }

    void diff_set(const ValueSet& a, const ValueSet& b)
    {
        for (const auto& elem : a) {
            if (b.count(elem)) continue;
            path_.push_back(SetElement{elem});
            script_.record_delete(path_);
            path_.pop_back();
        }
        for (const auto& elem : b) {
            if (a.count(elem)) continue;
            path_.push_back(SetElement{elem});
            script_.record_add(path_, *elem);
            path_.pop_back();
        }
    }

    // Indices in the script are positions in the partially patched result,
    // which is why result_idx is tracked apart from from_idx and to_idx.
    template <typename Seq>
    void diff_sequence(const Seq& a, const Seq& b, std::size_t depth)
    {
        const AlignTrace trace = edit_trace(a, b);

        std::size_t from_idx = 0;
        std::size_t result_idx = 0;
        std::size_t to_idx = 0;
        for (const auto& token : trace) {
            switch (token.op) {
                case AlignOp::Copy:
                    from_idx += token.count;
                    result_idx += token.count;
                    to_idx += token.count;
                    break;
                case AlignOp::Delete:
                    path_.push_back(result_idx);
                    script_.record_delete(path_);
                    path_.pop_back();
                    ++from_idx;
                    break;
                case AlignOp::Insert:
                    path_.push_back(result_idx);
                    script_.record_add(path_, *b[to_idx]);
                    path_.pop_back();
                    ++result_idx;
                    ++to_idx;
                    break;
                case AlignOp::Replace:
                    path_.push_back(result_idx);
                    diff_at(&a[from_idx].get(), &b[to_idx].get(), depth + 1);
                    path_.pop_back();
                    ++from_idx;
                    ++result_idx;
                    ++to_idx;
                    break;
            }
        }
    }

    const DiffOptions& options_;
    EditScript script_;
    Path path_;
};

} // anonymous namespace

std::optional<EditScript> diff(const Value& a, const Value& b, const DiffOptions& options)
{
    if (is_identical(a, b)) {
        return std::nullopt;
    }

    StructuralDiffer differ{a, options};
    differ.run(a.is_null() ? nullptr : &a, b.is_null() ? nullptr : &b);
    return differ.take();
}

} // namespace editscript
