#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/collection_loader.hpp"
#include "internal/db/api/vector_database.hpp"
#include "sqlite_db.hpp"

namespace entitystore::db::sqlite {

/*
  One collection's rows inside a shared documents table.

  Table layout (see EnsureDocumentTable):
    <table>(collection TEXT, id TEXT, body TEXT, embedding BLOB, PRIMARY KEY(collection, id))

  Bodies are protobuf-JSON documents. Rows are returned in rowid order, which
  is insertion order because updates keep the rowid.
*/
class SqliteDocumentTable {
 public:
  SqliteDocumentTable(std::shared_ptr<SqliteDB> db, std::string table, std::string collection,
                      std::shared_ptr<const nlp::Embedder> embedder);

  Result                  InsertOne(const Document& doc);
  std::vector<Document>   Find(const Filter& filter);
  std::optional<Document> FindOne(const Filter& filter);
  UpdateResult            UpdateOne(const Filter& filter, const Document& patch, bool upsert);
  DeleteResult            DeleteOne(const Filter& filter);
  std::size_t             Count();

  std::vector<SimilarDocument> FindSimilar(const Filter& filter, const std::string& query, std::size_t k);

  // Runs `loader` over every row in one transaction. Failed rows, and rows whose
  // body is not valid JSON, move to `sidecar`.
  LoadStats Load(const DocumentLoader& loader, SqliteDocumentTable& sidecar);

  // Recomputes stored embeddings, e.g. after the embedder changed.
  void Reembed();

  const std::string& Collection() const {
    return collection_;
  }

 private:
  struct Row {
    Document           doc;
    std::vector<float> embedding;
  };

  struct RawRow {
    std::string        id;
    std::string        body;
    std::vector<float> embedding;
  };

  std::vector<RawRow> ScanRaw(const std::optional<std::string>& pinned, bool with_embedding);
  // Unreadable bodies are logged and skipped.
  std::vector<Row>   Scan(const Filter& filter, bool with_embedding);
  std::vector<float> Embed(const Document& doc) const;
  Result             InsertRow(const Document& doc);
  Result             InsertRawRow(const std::string& id, const std::string& body);
  Result             ReplaceRow(const std::string& id, const Document& doc);
  Result             DeleteRow(const std::string& id);

  std::shared_ptr<SqliteDB>            db_;
  std::string                          table_;
  std::string                          collection_;
  std::shared_ptr<const nlp::Embedder> embedder_;
};

void EnsureDocumentTable(SqliteDB& db, const std::string& table);
void EnsureMetadataTable(SqliteDB& db, const std::string& table);

std::map<std::string, std::string> ReadMetadataTable(SqliteDB& db, const std::string& table);
Result UpsertMetadataRow(SqliteDB& db, const std::string& table, const std::string& key, const std::string& value);

std::vector<std::string> ListTableCollections(SqliteDB& db, const std::string& table);
std::size_t              CountTableCollection(SqliteDB& db, const std::string& table, const std::string& collection);

Result Translate(sqlite3* db, int rc);

} // namespace entitystore::db::sqlite
