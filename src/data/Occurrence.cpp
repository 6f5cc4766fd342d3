#include "planner/data/Occurrence.hpp"

namespace planner {
namespace data {

bool operator==(const JobSnapshot &lhs, const JobSnapshot &rhs)
{
    return lhs.businessName == rhs.businessName && lhs.contactName == rhs.contactName
           && lhs.phone == rhs.phone && lhs.addressLine1 == rhs.addressLine1
           && lhs.addressLine2 == rhs.addressLine2 && lhs.city == rhs.city && lhs.state == rhs.state
           && lhs.postalCode == rhs.postalCode && lhs.notes == rhs.notes
           && lhs.repairNotes == rhs.repairNotes && lhs.trailerColor == rhs.trailerColor
           && lhs.trailerSerial == rhs.trailerSerial && lhs.trailerDetails == rhs.trailerDetails
           && lhs.quote == rhs.quote && lhs.quoteText == rhs.quoteText
           && lhs.trailerColorOverwrite == rhs.trailerColorOverwrite && lhs.createdBy == rhs.createdBy;
}

} // namespace data
} // namespace planner
