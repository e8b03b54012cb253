#pragma once

#include <string>

namespace ocp {

// ------------------------------------------------------------
// 後端：Single 為預設，OpenMP 需編譯期支援
// ------------------------------------------------------------
enum class Backend {
    Auto = 0,
    Single = 1,
    OpenMP = 2,
};

// 把 Auto / 不支援的 OpenMP 收斂成實際可跑的後端
inline Backend resolve_backend(Backend b) {
#ifdef OCP_HAS_OPENMP
    return (b == Backend::Auto) ? Backend::OpenMP : b;
#else
    (void)b;
    return Backend::Single;
#endif
}

// "auto" / "single" / "openmp"（"omp" 亦可）
Backend parse_backend(const std::string& s);

} // namespace ocp
