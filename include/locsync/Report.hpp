#ifndef LOCSYNC_REPORT_HPP
#define LOCSYNC_REPORT_HPP

#include "locsync/Synchronizer.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace locsync {

/**
 * @brief Human-readable console output for sync reports
 *
 * ANSI colors are emitted only when enabled.
 */
class ConsoleReporter {
public:
    ConsoleReporter(std::ostream& out, bool color)
        : out_(out), color_(color) {}

    void single(const LocaleReport& report, const std::string& reference, bool fix);
    void audit(const AuditReport& report, bool fix);

private:
    std::string paint(const char* color, const std::string& text) const;
    void section(const std::string& title, const std::vector<std::string>& keys, const char* color);

    std::ostream& out_;
    bool color_;
};

} // namespace locsync

#endif // LOCSYNC_REPORT_HPP
