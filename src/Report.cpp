/**
 * @file Report.cpp
 * @brief Console rendering of sync reports
 */

#include "locsync/Report.hpp"

namespace locsync {

namespace {

const char* const kReset = "\x1b[0m";
const char* const kGreen = "\x1b[32m";
const char* const kYellow = "\x1b[33m";
const char* const kMagenta = "\x1b[35m";
const char* const kCyan = "\x1b[36m";

} // namespace

std::string ConsoleReporter::paint(const char* color, const std::string& text) const {
    if (!color_) {
        return text;
    }
    return std::string(color) + text + kReset;
}

void ConsoleReporter::section(const std::string& title, const std::vector<std::string>& keys, const char* color) {
    out_ << "\n" << paint(color, title) << "\n";
    for (const auto& key : keys) {
        out_ << "  - " << key << "\n";
    }
}

void ConsoleReporter::single(const LocaleReport& report, const std::string& reference, bool fix) {
    out_ << paint(kCyan, "=== Missing keys for " + report.document + (fix ? " (with --fix)" : "") + " ===") << "\n";
    out_ << "Reference: " << reference << " (" << report.reference_key_count << " keys)\n";
    out_ << "Target: " << report.document << " (" << report.target_key_count << " keys)\n";

    if (report.missing.empty()) {
        out_ << "\n" << paint(kGreen, "No missing keys!") << "\n\n";
        return;
    }

    if (!report.added.empty()) {
        section("Added " + std::to_string(report.added.size()) + " missing key(s) with EN placeholder:",
                report.added, kGreen);
    } else {
        section("Missing " + std::to_string(report.missing.size()) + " key(s):", report.missing, kYellow);
    }
    out_ << "\n";
}

void ConsoleReporter::audit(const AuditReport& report, bool fix) {
    out_ << paint(kCyan, std::string("=== Translation Audit") + (fix ? " (with --fix)" : "") + " ===") << "\n";
    out_ << "Reference: " << report.reference << " (" << report.reference_key_count << " keys)\n";
    out_ << "Checking " << report.locales.size() << " locale(s)...\n";

    for (const auto& locale : report.locales) {
        if (!locale.has_findings()) {
            continue;
        }
        out_ << "\n" << paint(kCyan, "--- " + locale.document + " ---") << "\n";

        if (!locale.added.empty()) {
            section("ADDED MISSING KEYS (with EN placeholder)", locale.added, kGreen);
        } else if (!locale.missing.empty()) {
            section("MISSING KEYS (in " + report.reference + " but not in this locale)", locale.missing, kYellow);
        }

        if (!locale.removed.empty()) {
            section("REMOVED EXTRANEOUS KEYS (were in this locale but not in " + report.reference + ")",
                    locale.removed, kMagenta);
        }
    }

    out_ << "\n" << paint(kCyan, "=== Summary ===") << "\n";
    if (report.total_added > 0) {
        out_ << paint(kGreen, "  Added missing keys (EN placeholder): " + std::to_string(report.total_added)) << "\n";
    }
    if (report.total_missing > 0) {
        out_ << paint(kYellow, "  Missing keys across all locales: " + std::to_string(report.total_missing)) << "\n";
    }
    if (report.total_removed > 0) {
        out_ << paint(kMagenta, "  Removed extraneous keys: " + std::to_string(report.total_removed)) << "\n";
    }
    if (report.in_sync()) {
        out_ << paint(kGreen, "  All locales are in sync!") << "\n";
    }
    out_ << "\n";
}

} // namespace locsync
