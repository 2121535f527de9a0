#include <Settler/token/amount.hpp>
#include <cmath>
#include <iomanip>

namespace Settler {

    namespace {
        int64 power_of_ten (uint32 decimals) {
            int64 p = 1;
            for (uint32 i = 0; i < decimals; i++) p *= 10;
            return p;
        }
    }

    atomic_amount to_atomic (double decimal, uint32 decimals) {
        return static_cast<atomic_amount> (std::llround (decimal * std::pow (10.0, decimals)));
    }

    double to_decimal (atomic_amount a, uint32 decimals) {
        return double (a) / std::pow (10.0, decimals);
    }

    std::string write_decimal (atomic_amount a, uint32 decimals) {
        int64 scale = power_of_ten (decimals);
        uint64 magnitude = a < 0 ? uint64 (-(a + 1)) + 1 : uint64 (a);

        std::stringstream ss;
        if (a < 0) ss << "-";
        ss << magnitude / scale;
        if (decimals > 0) ss << "." << std::setw (decimals) << std::setfill ('0') << magnitude % scale;
        return ss.str ();
    }

    maybe<double> read_decimal (const std::string &x) {
        if (x == "") return {};

        std::size_t processed = 0;
        double d;
        try {
            d = std::stod (x, &processed);
        } catch (const std::logic_error &) {
            return {};
        }

        if (processed != x.size () || !std::isfinite (d)) return {};
        return d;
    }

}
