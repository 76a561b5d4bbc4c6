/**
 * @file DocumentStore.hpp
 * @brief Storage seam between the synchronizer and the filesystem
 */

#ifndef LOCSYNC_DOCUMENTSTORE_HPP
#define LOCSYNC_DOCUMENTSTORE_HPP

#include "locsync/Node.hpp"

#include <string>
#include <vector>

namespace locsync {

/**
 * @brief Named collection of documents
 *
 * Documents are addressed by file name ("fr.json"), never by path.
 */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual bool exists(const std::string& name) const = 0;

    /**
     * @throws MalformedDocument if the document cannot be parsed
     */
    virtual Node load(const std::string& name) const = 0;

    /**
     * @brief Replace the whole document
     * @throws PersistFailure if the write fails
     */
    virtual void persist(const std::string& name, const Node& tree) = 0;

    // Names of all documents ending with `extension`, sorted
    virtual std::vector<std::string> list(const std::string& extension) const = 0;
};

/**
 * @brief Documents stored as files in one directory
 *
 * Writes go to a temporary sibling which is then renamed over the target,
 * so an interrupted write leaves the previous version in place.
 */
class DirectoryStore : public DocumentStore {
public:
    explicit DirectoryStore(std::string directory, int indent = 2);

    bool exists(const std::string& name) const override;
    Node load(const std::string& name) const override;
    void persist(const std::string& name, const Node& tree) override;
    std::vector<std::string> list(const std::string& extension) const override;

    const std::string& directory() const noexcept { return directory_; }

private:
    std::string path_of(const std::string& name) const;

    std::string directory_;
    int indent_;
};

} // namespace locsync

#endif // LOCSYNC_DOCUMENTSTORE_HPP
