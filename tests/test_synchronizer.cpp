/**
 * @file test_synchronizer.cpp
 * @brief Tests for per-locale sync and the two run modes
 *
 * The runs use the reference R = {a: {b: "X"}, c: "Y"} against an
 * in-memory store.
 */

#include <gtest/gtest.h>
#include "locsync/Synchronizer.hpp"
#include "locsync/Errors.hpp"
#include "locsync/Util.hpp"

#include <map>

using namespace locsync;

namespace {

Node tree(const char* json) {
    return Node::from_value(Value::parse(json));
}

/**
 * @brief DocumentStore backed by a map; counts writes per document
 */
class MemoryStore : public DocumentStore {
public:
    std::map<std::string, Node> documents;
    std::map<std::string, int> writes;
    std::string fail_on_load;

    bool exists(const std::string& name) const override {
        return documents.count(name) > 0;
    }

    Node load(const std::string& name) const override {
        if (name == fail_on_load) {
            throw MalformedDocument(name, "unexpected token");
        }
        return documents.at(name);
    }

    void persist(const std::string& name, const Node& tree) override {
        documents[name] = tree;
        ++writes[name];
    }

    std::vector<std::string> list(const std::string& extension) const override {
        std::vector<std::string> names;
        for (const auto& [name, doc] : documents) {
            if (ends_with(name, extension)) names.push_back(name);
        }
        return names;
    }

    int write_count(const std::string& name) const {
        auto it = writes.find(name);
        return it == writes.end() ? 0 : it->second;
    }
};

class SynchronizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.documents["en.json"] = tree(R"({"a": {"b": "X"}, "c": "Y"})");
    }

    Synchronizer make() {
        return Synchronizer(store, SyncOptions{});
    }

    MemoryStore store;
};

} // namespace

// ============================================================================
// sync_locale (pure)
// ============================================================================

TEST(SyncLocale, SingleModeNeverPrunes) {
    FlatIndex ref = flatten(tree(R"({"a": {"b": "X"}, "c": "Y"})"));
    SyncPolicy policy;
    policy.mode = SyncMode::SingleLocale;
    policy.fix = true;

    auto outcome = sync_locale(ref, tree(R"({"d": "Z"})"), policy);
    EXPECT_FALSE(outcome.pruned);
    EXPECT_TRUE(outcome.injected);
    EXPECT_NE(outcome.tree.find("d"), nullptr);
    ASSERT_EQ(outcome.diff.extraneous_keys.size(), 1u);
}

TEST(SyncLocale, AllModePrunesWithoutFix) {
    FlatIndex ref = flatten(tree(R"({"c": "Y"})"));
    SyncPolicy policy;
    policy.mode = SyncMode::AllLocales;
    policy.fix = false;

    auto outcome = sync_locale(ref, tree(R"({"c": "y", "d": "Z"})"), policy);
    EXPECT_TRUE(outcome.pruned);
    EXPECT_FALSE(outcome.injected);
    EXPECT_EQ(outcome.tree, tree(R"({"c": "y"})"));
    EXPECT_EQ(outcome.target_key_count, 2u);
}

TEST(SyncLocale, UnmodifiedTreeKeepsEmptyBranches) {
    FlatIndex ref = flatten(tree(R"({"c": "Y"})"));
    auto outcome = sync_locale(ref, tree(R"({"c": "y", "e": {}})"), SyncPolicy{});
    EXPECT_FALSE(outcome.modified());
    EXPECT_NE(outcome.tree.find("e"), nullptr);
}

TEST(SyncLocale, ModifiedTreeHasNoEmptyBranches) {
    FlatIndex ref = flatten(tree(R"({"c": "Y", "n": "N"})"));
    SyncPolicy policy;
    policy.fix = true;
    auto outcome = sync_locale(ref, tree(R"({"c": "y", "e": {"f": {}}})"), policy);
    EXPECT_TRUE(outcome.modified());
    EXPECT_EQ(outcome.tree, tree(R"({"c": "y", "n": "EN TEXT TO REPLACE: N"})"));
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(SynchronizerTest, AllLocalesWithFixConverges) {
    store.documents["fr.json"] = tree(R"({"a": {}, "d": "Z"})");
    auto audit = make().sync_all(true);

    EXPECT_EQ(store.documents["fr.json"],
              tree(R"({"a": {"b": "EN TEXT TO REPLACE: X"}, "c": "EN TEXT TO REPLACE: Y"})"));
    EXPECT_EQ(store.write_count("fr.json"), 1);

    ASSERT_EQ(audit.locales.size(), 1u);
    const auto& fr = audit.locales[0];
    EXPECT_EQ(fr.missing, (std::vector<std::string>{"a.b", "c"}));
    EXPECT_EQ(fr.removed, (std::vector<std::string>{"d"}));
    EXPECT_EQ(fr.added, fr.missing);
    EXPECT_EQ(fr.state, LocaleState::Persisted);
    EXPECT_EQ(audit.total_added, 2u);
    EXPECT_EQ(audit.total_missing, 0u);
    EXPECT_EQ(audit.total_removed, 1u);
}

TEST_F(SynchronizerTest, SingleLocaleWithoutFixOnlyReports) {
    store.documents["fr.json"] = tree(R"({"a": {}, "d": "Z"})");
    auto report = make().sync_single("fr", false);

    EXPECT_EQ(report.document, "fr.json");
    EXPECT_EQ(report.missing, (std::vector<std::string>{"a.b", "c"}));
    EXPECT_TRUE(report.removed.empty());
    EXPECT_TRUE(report.added.empty());
    EXPECT_EQ(report.state, LocaleState::Unchanged);
    EXPECT_EQ(store.write_count("fr.json"), 0);
    EXPECT_NE(store.documents["fr.json"].find("d"), nullptr);
}

TEST_F(SynchronizerTest, AllLocalesWithoutFixStillRemoves) {
    store.documents["fr.json"] = tree(R"({"a": {}, "d": "Z"})");
    auto audit = make().sync_all(false);

    EXPECT_EQ(store.write_count("fr.json"), 1);
    EXPECT_EQ(store.documents["fr.json"].find("d"), nullptr);
    EXPECT_EQ(store.documents["fr.json"].find("c"), nullptr);

    const auto& fr = audit.locales.at(0);
    EXPECT_EQ(fr.missing, (std::vector<std::string>{"a.b", "c"}));
    EXPECT_TRUE(fr.added.empty());
    EXPECT_EQ(audit.total_missing, 2u);
    EXPECT_EQ(audit.total_removed, 1u);
    EXPECT_FALSE(audit.in_sync());
}

TEST_F(SynchronizerTest, InSyncLocaleIsNeverWritten) {
    store.documents["fr.json"] = tree(R"({"a": {"b": "X"}, "c": "Y"})");
    auto synchronizer = make();

    auto report = synchronizer.sync_single("fr.json", true);
    auto audit = synchronizer.sync_all(true);

    EXPECT_TRUE(report.missing.empty());
    EXPECT_EQ(report.state, LocaleState::Unchanged);
    EXPECT_TRUE(audit.in_sync());
    EXPECT_FALSE(audit.locales.at(0).has_findings());
    EXPECT_EQ(store.write_count("fr.json"), 0);
}

TEST_F(SynchronizerTest, LeafWhereBranchExpectedIsReplaced) {
    store.documents["fr.json"] = tree(R"({"a": "leaf", "c": "Y"})");
    make().sync_all(true);

    EXPECT_EQ(store.documents["fr.json"], tree(R"({"a": {"b": "EN TEXT TO REPLACE: X"}, "c": "Y"})"));
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(SynchronizerTest, SecondPassChangesNothing) {
    store.documents["de.json"] = tree(R"({"a": {"z": 1}, "q": [1], "c": "Ypsilon"})");
    auto synchronizer = make();

    synchronizer.sync_all(true);
    Node after_first = store.documents["de.json"];
    auto second = synchronizer.sync_all(true);

    EXPECT_EQ(store.documents["de.json"], after_first);
    EXPECT_EQ(store.write_count("de.json"), 1);
    EXPECT_TRUE(second.in_sync());
}

TEST_F(SynchronizerTest, EmptyBranchWhereLeafExpectedConvergesInOnePass) {
    store.documents["en.json"] = tree(R"({"a": "X", "c": {"d": "Y"}})");
    store.documents["fr.json"] = tree(R"({"a": {}, "c": {"d": "Y"}})");
    auto synchronizer = make();

    auto first = synchronizer.sync_all(true);
    ASSERT_EQ(first.locales.size(), 1u);
    EXPECT_EQ(first.locales[0].added, (std::vector<std::string>{"a"}));
    EXPECT_EQ(store.documents["fr.json"], tree(R"({"a": "EN TEXT TO REPLACE: X", "c": {"d": "Y"}})"));
    EXPECT_EQ(flatten(store.documents["fr.json"]).keys(), synchronizer.reference_index().keys());

    Node after_first = store.documents["fr.json"];
    auto second = synchronizer.sync_all(true);
    EXPECT_TRUE(second.in_sync());
    EXPECT_EQ(store.documents["fr.json"], after_first);
    EXPECT_EQ(store.write_count("fr.json"), 1);
}

TEST(SyncLocale, EmptyBranchAtMissingLeafIsFilled) {
    FlatIndex ref = flatten(tree(R"({"a": "X", "c": {"d": "Y"}})"));
    SyncPolicy policy;
    policy.fix = true;

    LocaleOutcome first = sync_locale(ref, tree(R"({"a": {}, "c": {"d": "Y"}})"), policy);
    EXPECT_TRUE(first.modified());
    EXPECT_EQ(flatten(first.tree).size(), 2u);

    LocaleOutcome second = sync_locale(ref, first.tree, policy);
    EXPECT_FALSE(second.modified());
    EXPECT_EQ(second.tree, first.tree);
}

TEST_F(SynchronizerTest, ExactConvergenceAndValuePreservation) {
    store.documents["en.json"] = tree(R"({
        "nav": {"home": "Home", "about": "About", "deep": {"x": "X"}},
        "days": ["Mon", "Tue"],
        "count": 3
    })");
    store.documents["es.json"] = tree(R"({
        "nav": {"home": "Inicio", "legacy": "Viejo"},
        "days": ["Lun"],
        "gone": {"a": {"b": 1}}
    })");
    make().sync_all(true);

    const Node& es = store.documents["es.json"];
    EXPECT_EQ(flatten(es).keys(), flatten(store.documents["en.json"]).keys());
    EXPECT_EQ(es.find("nav")->find("home")->value(), "Inicio");
    EXPECT_EQ(es.find("days")->value(), Value::parse(R"(["Lun"])"));
    EXPECT_EQ(es.find("nav")->find("about")->value(), "EN TEXT TO REPLACE: About");
    EXPECT_EQ(es.find("count")->value(), "EN TEXT TO REPLACE: 3");
    EXPECT_EQ(es.find("gone"), nullptr);
}

TEST_F(SynchronizerTest, SingleLocaleWithFixAddsButKeepsExtraneous) {
    store.documents["fr.json"] = tree(R"({"d": "Z"})");
    auto report = make().sync_single("fr", true);

    EXPECT_EQ(report.added, (std::vector<std::string>{"a.b", "c"}));
    EXPECT_EQ(report.state, LocaleState::Persisted);
    EXPECT_EQ(store.documents["fr.json"].find("d")->value(), "Z");
    EXPECT_EQ(store.write_count("fr.json"), 1);
}

TEST_F(SynchronizerTest, ReferenceIsNeverWritten) {
    store.documents["fr.json"] = tree(R"({"d": "Z"})");
    store.documents["it.json"] = tree(R"({})");
    make().sync_all(true);
    EXPECT_EQ(store.write_count("en.json"), 0);
}

// ============================================================================
// Discovery and errors
// ============================================================================

TEST_F(SynchronizerTest, DiscoversLocalesExceptReference) {
    store.documents["fr.json"] = tree(R"({})");
    store.documents["de.json"] = tree(R"({})");
    store.documents["notes.toml"] = tree(R"({})");

    auto names = make().locale_documents();
    EXPECT_EQ(names, (std::vector<std::string>{"de.json", "fr.json"}));
}

TEST_F(SynchronizerTest, DocumentNameAppendsExtension) {
    auto synchronizer = make();
    EXPECT_EQ(synchronizer.document_name("fr"), "fr.json");
    EXPECT_EQ(synchronizer.document_name("fr.json"), "fr.json");
}

TEST_F(SynchronizerTest, ReferenceKeyCountIsReported) {
    store.documents["fr.json"] = tree(R"({"c": "Y", "x": 1, "y": 2})");
    auto report = make().sync_single("fr", false);
    EXPECT_EQ(report.reference_key_count, 2u);
    EXPECT_EQ(report.target_key_count, 3u);
}

TEST(SynchronizerErrors, MissingReference) {
    MemoryStore store;
    store.documents["fr.json"] = tree(R"({})");
    EXPECT_THROW({ Synchronizer synchronizer(store, SyncOptions{}); }, MissingReferenceDocument);
}

TEST_F(SynchronizerTest, MissingLocale) {
    EXPECT_THROW(make().sync_single("pt", false), MissingLocaleDocument);
}

TEST_F(SynchronizerTest, MalformedLocaleAbortsRemainingBatch) {
    store.documents["de.json"] = tree(R"({"d": 1})");
    store.documents["es.json"] = tree(R"({})");
    store.documents["fr.json"] = tree(R"({"d": 1})");
    store.fail_on_load = "es.json";

    auto synchronizer = make();
    EXPECT_THROW(synchronizer.sync_all(true), MalformedDocument);
    // Earlier locales stay written, later ones are untouched
    EXPECT_EQ(store.write_count("de.json"), 1);
    EXPECT_EQ(store.write_count("fr.json"), 0);
}

TEST(SynchronizerOptions, CustomReferenceAndPlaceholder) {
    MemoryStore store;
    store.documents["base.json"] = tree(R"({"k": "v"})");
    store.documents["nl.json"] = tree(R"({})");

    SyncOptions options;
    options.reference_name = "base.json";
    options.placeholder_prefix = "TODO ";
    Synchronizer(store, options).sync_all(true);

    EXPECT_EQ(store.documents["nl.json"].find("k")->value(), "TODO v");
}
