#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/document.hpp"
#include "internal/db/api/filter.hpp"
#include "internal/db/api/result.hpp"

namespace entitystore::db {

struct UpdateResult {
  std::size_t             matched_count = 0;
  std::optional<Document> updated_document;
};

struct DeleteResult {
  std::size_t             deleted_count = 0;
  std::optional<Document> deleted_document;
};

/*
  Applied to every persisted document when a collection is opened.

  Returns the (possibly upgraded) document, or nullopt to move it to the
  collection's failed-migrations sidecar. Throwing util::UnmigratableDocument
  has the same effect; any other exception aborts the open.
*/
using DocumentLoader = std::function<std::optional<Document>(const Document&)>;

/*
  Key/value metadata, one namespace per database.
*/
class MetadataStore {
 public:
  virtual ~MetadataStore() = default;

  virtual std::map<std::string, std::string> ReadMetadata()                                              = 0;
  virtual Result                             UpsertMetadata(const std::string& key, const std::string& value) = 0;
};

/*
  Named set of documents, unique by "id".

  Find() returns documents in insertion order. Implementations are safe to call
  from multiple threads; multi-call atomicity is the caller's concern.
*/
class DocumentCollection {
 public:
  virtual ~DocumentCollection() = default;

  virtual const std::string& Name() const = 0;

  // AlreadyExists when a document with the same id is present.
  virtual Result InsertOne(const Document& doc) = 0;

  virtual std::vector<Document>   Find(const Filter& filter)    = 0;
  virtual std::optional<Document> FindOne(const Filter& filter) = 0;

  // Merges `patch` into the first match. With upsert, inserts `patch` when nothing matches.
  virtual UpdateResult UpdateOne(const Filter& filter, const Document& patch, bool upsert = false) = 0;

  virtual DeleteResult DeleteOne(const Filter& filter) = 0;

  virtual std::size_t Count() = 0;
};

class DocumentDatabase : public MetadataStore {
 public:
  virtual std::shared_ptr<DocumentCollection> GetOrCreateCollection(const std::string& name,
                                                                    const DocumentLoader& loader) = 0;

  virtual std::vector<std::string> ListCollections() = 0;

  // Documents stored under `collection`, 0 when it was never created. Runs no loader.
  virtual std::size_t CountDocuments(const std::string& collection) = 0;
};

DocumentLoader IdentityLoader();

} // namespace entitystore::db
