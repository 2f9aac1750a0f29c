#include "binchain/limits.hpp"

#include "binchain/errors.hpp"

namespace binchain
{

    void validate_limits(const ReaderLimits &limits)
    {
        if (limits.max_part_size == 0)
        {
            throw ArgumentError(ErrorCode::InvalidLimits, "max part size must be positive");
        }
    }

} // namespace binchain
