#pragma once

/// @file src/filtering/fp_exception_mask.hpp
/// @brief Scoped masking of divide-by-zero / invalid floating-point events.
///
/// Internal header. Wrap exactly the elementwise divisions whose singular
/// points are expected (DC term, zero directional factors):
///
/// ```cpp
/// ComplexGrid op;
/// {
///     ScopedFpExceptionMask mask;
///     op = num / den;            // evaluated inside the scope
/// }
/// ```
///
/// On entry the FP environment is saved and switched to non-stop mode, so
/// a caller that enabled traps does not get SIGFPE. On exit the
/// divide-by-zero and invalid flags raised inside the scope are discarded
/// and the saved environment (including any other pending flags) is
/// restored.

#include <cfenv>

namespace potfield::detail {

class ScopedFpExceptionMask {
public:
    ScopedFpExceptionMask() noexcept { std::feholdexcept(&saved_); }

    ~ScopedFpExceptionMask() {
        std::feclearexcept(FE_DIVBYZERO | FE_INVALID);
        std::feupdateenv(&saved_);
    }

    ScopedFpExceptionMask(const ScopedFpExceptionMask&)            = delete;
    ScopedFpExceptionMask& operator=(const ScopedFpExceptionMask&) = delete;

private:
    std::fenv_t saved_{};
};

} // namespace potfield::detail
