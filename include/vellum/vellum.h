#ifndef VELLUM_H
#define VELLUM_H

#ifdef __cplusplus
extern "C" {
#endif

// NOLINTNEXTLINE(performance-enum-size)
enum vellum_severity {
    VELLUM_SEVERITY_MIN = 0,
    VELLUM_SEVERITY_TRACE = 10,
    VELLUM_SEVERITY_DEBUG = 20,
    VELLUM_SEVERITY_INFO = 30,
    VELLUM_SEVERITY_SOFT_WARNING = 40,
    VELLUM_SEVERITY_WARNING = 50,
    VELLUM_SEVERITY_ERROR = 70,
    VELLUM_SEVERITY_FATAL = 90,
    VELLUM_SEVERITY_MAX = 90,
    VELLUM_SEVERITY_NONE = 100,
};

// NOLINTNEXTLINE(performance-enum-size)
enum vellum_render_error {
    /// @brief The text sink refused to accept a write.
    /// All output after the failed write is discarded.
    VELLUM_RENDER_ERROR_WRITE,
    /// @brief A producer reported an error of its own while rendering.
    VELLUM_RENDER_ERROR_PRODUCER,
};

#ifdef __cplusplus
}
#endif

#endif
