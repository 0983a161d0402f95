// sequence_aligner.cpp - Trace coalescing and formatting

#include <editscript/sequence_aligner.h>

namespace editscript {

AlignTrace coalesce(const AlignTrace& trace)
{
    auto out = AlignTrace{}.transient();
    const std::size_t size = trace.size();
    std::size_t i = 0;
    while (i < size) {
        const AlignToken& token = trace[i];
        const bool lone_delete = token.op == AlignOp::Delete &&
                                 (i == 0 || trace[i - 1].op != AlignOp::Delete);
        if (lone_delete && i + 1 < size && trace[i + 1].op == AlignOp::Insert) {
            out.push_back(AlignToken::rep());
            i += 2;
        } else {
            out.push_back(token);
            i += 1;
        }
    }
    return out.persistent();
}

std::string trace_to_string(const AlignTrace& trace)
{
    std::string result;
    for (const auto& token : trace) {
        if (!result.empty()) result += ' ';
        switch (token.op) {
            case AlignOp::Copy:    result += std::to_string(token.count); break;
            case AlignOp::Delete:  result += '-'; break;
            case AlignOp::Insert:  result += '+'; break;
            case AlignOp::Replace: result += 'r'; break;
        }
    }
    return result;
}

} // namespace editscript
