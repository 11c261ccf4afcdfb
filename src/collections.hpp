#pragma once
#include "connection.hpp"
#include <optional>
#include <string>
#include <vector>

namespace quasar
{

  // Physical table lifecycle. All names passed in here are already
  // sanitized; exists() propagates engine faults instead of reporting false.
  class CollectionManager
  {
  public:
    // name -> vector dimension, recorded by the first write to a collection
    static constexpr const char *kMetaTable = "_collection_meta";

    explicit CollectionManager(Connection &conn) : conn_(conn) {}

    bool exists(const std::string &name);
    void create(const std::string &name);
    // also forgets the recorded dimension
    void drop(const std::string &name);
    std::vector<std::string> list();

    // drops every user table; a failure on one table is logged and the
    // rest are still dropped. Returns the number of tables dropped.
    size_t dropAll();

    // Callers hold the gate for both: read the dimension, then commit the
    // rows together with recordDimension() in one transaction.
    static std::optional<size_t> dimensionOf(Env &env, const std::string &name);
    static std::vector<Statement> recordDimension(const std::string &name, size_t dimension);

  private:
    Connection &conn_;
  };

} // namespace quasar
