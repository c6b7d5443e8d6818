#ifndef BONDCURVE_CURVE_ERROR_HPP
#define BONDCURVE_CURVE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace bondcurve {

enum class CurveErrc {
    InvalidConfig,
    OutOfRange,
    ZeroInput,
    ExceedsPool,
};

const char* errc_name(CurveErrc code);

// Thrown by every curve operation; carries one of the four error kinds.
class CurveError : public std::runtime_error {
public:
    CurveError(CurveErrc code, const std::string& what)
        : std::runtime_error(std::string(errc_name(code)) + ": " + what), code_(code) {}

    CurveErrc code() const noexcept { return code_; }

private:
    CurveErrc code_;
};

} // namespace bondcurve

#endif // BONDCURVE_CURVE_ERROR_HPP
