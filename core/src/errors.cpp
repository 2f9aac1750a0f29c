#include "binchain/errors.hpp"

namespace binchain
{

    Error::Error(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code)
    {
    }

} // namespace binchain
