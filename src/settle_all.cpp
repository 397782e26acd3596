// ===================== src/settle_all.cpp =====================
#include "settle_all.hpp"

#include <stdexcept>

namespace geoip
{
    std::string describe(const std::exception_ptr &error)
    {
        if (!error)
            return "no error";
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception &e)
        {
            return e.what();
        }
        catch (...)
        {
            return "non-standard exception";
        }
    }
} // namespace geoip
