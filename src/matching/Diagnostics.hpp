#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace matching
{

/**
 * @brief Process-wide switches for matcher tracing.
 *
 * Matching, registry and standardize code logs to plog instance kLogInstance. Team names
 * go through Preview() before they reach a log line, so a stray control character or a
 * pasted paragraph cannot break the log layout.
 */
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;
    static constexpr std::size_t kDefaultMaxPreview = 96;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    /// Clamped to at least one byte
    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    /// Quoted, escaped and cut on a UTF-8 boundary; "... (N bytes)" marks a cut
    [[nodiscard]] static std::string Preview(std::string_view text);

    /// \n \r \t become escapes, other control bytes become '?'
    [[nodiscard]] static std::string Escape(std::string_view text);

private:
    static std::atomic<bool> s_verbose;
    static std::atomic<std::size_t> s_max_preview;
};

} // namespace matching
