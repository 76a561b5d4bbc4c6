/**
 * @file Synchronizer.hpp
 * @brief Per-locale synchronization and the two run modes
 *
 * Single-locale mode only ever adds keys (and only with fix enabled).
 * All-locales mode always removes extraneous keys, and adds missing keys
 * when fix is enabled.
 */

#ifndef LOCSYNC_SYNCHRONIZER_HPP
#define LOCSYNC_SYNCHRONIZER_HPP

#include "locsync/Diff.hpp"
#include "locsync/DocumentStore.hpp"
#include "locsync/Flatten.hpp"
#include "locsync/Inject.hpp"
#include "locsync/Node.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace locsync {

enum class SyncMode { SingleLocale, AllLocales };

// Final state of one locale document after a run
enum class LocaleState { Persisted, Unchanged };

struct SyncPolicy {
    SyncMode mode = SyncMode::AllLocales;
    bool fix = false;
    std::string placeholder_prefix = kDefaultPlaceholderPrefix;
};

/**
 * @brief Result of synchronizing one tree
 */
struct LocaleOutcome {
    Node tree;
    DiffResult diff;
    std::size_t target_key_count = 0;
    bool pruned = false;
    bool injected = false;

    bool modified() const noexcept { return pruned || injected; }
};

/**
 * @brief Synchronize one locale tree against the flattened reference
 *
 * Diffs the target, prunes extraneous keys (all-locales mode only), then
 * injects placeholders for missing keys (fix only). A modified tree has
 * its empty branches collapsed. Pure: no I/O.
 */
LocaleOutcome sync_locale(const FlatIndex& reference, const Node& target, const SyncPolicy& policy);

struct SyncOptions {
    std::string reference_name = "en.json";
    std::string extension = ".json";
    std::string placeholder_prefix = kDefaultPlaceholderPrefix;
};

/**
 * @brief Report data for one locale; keys are in canonical dotted form
 */
struct LocaleReport {
    std::string document;
    std::size_t reference_key_count = 0;
    std::size_t target_key_count = 0;
    std::vector<std::string> missing;
    std::vector<std::string> removed;
    std::vector<std::string> added;
    LocaleState state = LocaleState::Unchanged;

    bool has_findings() const noexcept { return !missing.empty() || !removed.empty(); }
};

struct AuditReport {
    std::string reference;
    std::size_t reference_key_count = 0;
    std::vector<LocaleReport> locales;
    std::size_t total_added = 0;
    // Missing keys left in place because fix was off
    std::size_t total_missing = 0;
    std::size_t total_removed = 0;

    bool in_sync() const noexcept {
        return total_added == 0 && total_missing == 0 && total_removed == 0;
    }
};

/**
 * @brief Drives synchronization over a DocumentStore
 *
 * The reference document is loaded once at construction and never
 * written. A failure on one locale propagates; locales already persisted
 * in the same run stay persisted.
 */
class Synchronizer {
public:
    /**
     * @throws MissingReferenceDocument if the store has no reference
     * @throws MalformedDocument if the reference cannot be parsed
     */
    Synchronizer(DocumentStore& store, SyncOptions options);

    /**
     * @brief Single-locale mode
     *
     * @param locale Locale id ("fr") or document name ("fr.json")
     * @param fix Add placeholders for missing keys and persist
     * @throws MissingLocaleDocument if the document doesn't exist
     */
    LocaleReport sync_single(const std::string& locale, bool fix);

    /**
     * @brief All-locales mode over every non-reference document
     */
    AuditReport sync_all(bool fix);

    // "fr" → "fr.json"; names that already carry the extension are kept
    std::string document_name(const std::string& locale) const;

    // Sorted names of every locale document except the reference
    std::vector<std::string> locale_documents() const;

    const FlatIndex& reference_index() const noexcept { return reference_; }
    const SyncOptions& options() const noexcept { return options_; }

private:
    LocaleReport process(const std::string& document, const SyncPolicy& policy);

    DocumentStore& store_;
    SyncOptions options_;
    FlatIndex reference_;
};

} // namespace locsync

#endif // LOCSYNC_SYNCHRONIZER_HPP
