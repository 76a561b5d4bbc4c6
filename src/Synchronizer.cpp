/**
 * @file Synchronizer.cpp
 * @brief Per-locale synchronization and run modes
 */

#include "locsync/Synchronizer.hpp"
#include "locsync/Errors.hpp"
#include "locsync/Prune.hpp"
#include "locsync/Util.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace locsync {

LocaleOutcome sync_locale(const FlatIndex& reference, const Node& target, const SyncPolicy& policy) {
    LocaleOutcome outcome;
    const FlatIndex target_flat = flatten(target);
    outcome.target_key_count = target_flat.size();
    outcome.diff = diff(reference, target_flat);
    outcome.tree = target;

    // Single-locale mode never deletes
    if (policy.mode == SyncMode::AllLocales && !outcome.diff.extraneous_keys.empty()) {
        outcome.tree = remove_extraneous_keys(outcome.tree, outcome.diff.extraneous_keys);
        outcome.pruned = true;
    }

    if (policy.fix && !outcome.diff.missing_keys.empty()) {
        outcome.tree = add_missing_keys(std::move(outcome.tree), outcome.diff.missing_keys,
                                        reference, policy.placeholder_prefix);
        outcome.injected = true;
    }

    if (outcome.modified()) {
        outcome.tree = collapse_empty_branches(outcome.tree);
    }
    return outcome;
}

Synchronizer::Synchronizer(DocumentStore& store, SyncOptions options)
    : store_(store), options_(std::move(options)) {
    if (!store_.exists(options_.reference_name)) {
        throw MissingReferenceDocument(options_.reference_name);
    }
    reference_ = flatten(store_.load(options_.reference_name));
    spdlog::debug("reference {} has {} keys", options_.reference_name, reference_.size());
}

std::string Synchronizer::document_name(const std::string& locale) const {
    if (ends_with(locale, options_.extension)) {
        return locale;
    }
    return locale + options_.extension;
}

std::vector<std::string> Synchronizer::locale_documents() const {
    std::vector<std::string> names;
    for (auto& name : store_.list(options_.extension)) {
        if (name != options_.reference_name) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

LocaleReport Synchronizer::sync_single(const std::string& locale, bool fix) {
    const std::string document = document_name(locale);
    if (!store_.exists(document)) {
        throw MissingLocaleDocument(document);
    }

    SyncPolicy policy;
    policy.mode = SyncMode::SingleLocale;
    policy.fix = fix;
    policy.placeholder_prefix = options_.placeholder_prefix;
    return process(document, policy);
}

AuditReport Synchronizer::sync_all(bool fix) {
    AuditReport audit;
    audit.reference = options_.reference_name;
    audit.reference_key_count = reference_.size();

    SyncPolicy policy;
    policy.mode = SyncMode::AllLocales;
    policy.fix = fix;
    policy.placeholder_prefix = options_.placeholder_prefix;

    for (const auto& document : locale_documents()) {
        LocaleReport report = process(document, policy);

        if (!report.added.empty()) {
            audit.total_added += report.added.size();
        } else {
            audit.total_missing += report.missing.size();
        }
        audit.total_removed += report.removed.size();

        audit.locales.push_back(std::move(report));
    }
    return audit;
}

LocaleReport Synchronizer::process(const std::string& document, const SyncPolicy& policy) {
    const Node tree = store_.load(document);
    LocaleOutcome outcome = sync_locale(reference_, tree, policy);

    LocaleReport report;
    report.document = document;
    report.reference_key_count = reference_.size();
    report.target_key_count = outcome.target_key_count;
    report.missing = to_strings(outcome.diff.missing_keys);
    if (outcome.pruned) {
        report.removed = to_strings(outcome.diff.extraneous_keys);
    }
    if (outcome.injected) {
        report.added = report.missing;
    }

    if (outcome.modified()) {
        spdlog::debug("{}: removed {}, added {}", document, report.removed.size(), report.added.size());
        store_.persist(document, outcome.tree);
        report.state = LocaleState::Persisted;
    }
    return report;
}

} // namespace locsync
