#include <algorithm>
#include <eavdb/query/filter.h>

namespace eavdb::query {

ParsedOp parseOp(std::string_view op) {
    ParsedOp parsed;
    if (op.substr(0, kNegationPrefix.size()) == kNegationPrefix) {
        parsed.negated = true;
        op.remove_prefix(kNegationPrefix.size());
    }
    parsed.op = std::string(op);
    return parsed;
}

Result<FilterType> getFilterType(std::string_view op) {
    auto parsed = parseOp(op);
    if (std::find(kBinaryOps.begin(), kBinaryOps.end(), parsed.op) != kBinaryOps.end()) {
        return FilterType::Binary;
    }
    if (parsed.op == kExistenceOp) {
        return FilterType::Existence;
    }
    return Error{ErrorCode::UnknownFilterType,
                 "unknown filter type '" + std::string(op) + "'"};
}

} // namespace eavdb::query
