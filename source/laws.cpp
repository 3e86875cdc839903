// laws.cpp
// Descriptions for lens law and traversal invariant violations

#include <lager_optics/laws.h>

namespace lager_optics {

std::string_view law_name(LawViolation violation)
{
    switch (violation) {
        case LawViolation::None:
            return "none";
        case LawViolation::GetSet:
            return "get-set";
        case LawViolation::SetGet:
            return "set-get";
        case LawViolation::SetSet:
            return "set-set";
        case LawViolation::CountChanged:
            return "count";
        case LawViolation::PositionMismatch:
            return "position";
        case LawViolation::IdentityChanged:
            return "identity";
    }
    return "unknown";
}

LawCheckResult law_failure(LawViolation violation, std::size_t position)
{
    LawCheckResult result;
    result.success = false;
    result.violation = violation;
    result.position = position;

    switch (violation) {
        case LawViolation::None:
            result.success = true;
            break;
        case LawViolation::GetSet:
            result.message = "setting the part just read changed the whole";
            break;
        case LawViolation::SetGet:
            result.message = "reading back a part just set returned a different value";
            break;
        case LawViolation::SetSet:
            result.message = "setting twice differs from setting the last value once";
            break;
        case LawViolation::CountChanged:
            result.message = "over() changed the number of occurrences";
            break;
        case LawViolation::PositionMismatch:
            result.message = "occurrence " + std::to_string(position) +
                             " after over() is not the function applied to occurrence " +
                             std::to_string(position) + " before";
            break;
        case LawViolation::IdentityChanged:
            result.message = "over() with the identity changed the whole";
            break;
    }
    if (!result.success) {
        result.message = std::string{law_name(violation)} + " law: " + result.message;
    }
    return result;
}

} // namespace lager_optics
