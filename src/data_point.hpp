#pragma once
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quasar
{

  // Which fields of an entity feed its embedding. index_fields[0] names the
  // text that is embedded; embeddable_fields is the fallback when no index
  // field is declared.
  struct IndexSpec
  {
    std::vector<std::string> embeddableFields{};
    std::vector<std::string> indexFields{};
  };

  // Nodeset tag carried in a node payload's belongs_to_set
  struct NodeSetRef
  {
    std::string type{"NodeSet"};
    std::string name{};
  };

  class DataPoint
  {
  public:
    // fields must be a JSON object. An empty id is replaced by a fresh UUID.
    // Throws InvalidDataPoint when the descriptor names a field that is absent.
    DataPoint(std::string type, nlohmann::json fields, IndexSpec index = {}, std::string id = {});

    const std::string &id() const { return id_; }
    const std::string &type() const { return type_; }
    const nlohmann::json &fields() const { return fields_; }
    const IndexSpec &index() const { return index_; }

    // empty when neither index nor embeddable fields are declared
    const std::optional<std::string> &embeddableText() const { return embeddableText_; }

    // string value of the "name" field, or empty
    std::string name() const;

    void addToSet(NodeSetRef set);
    const std::vector<NodeSetRef> &belongsToSet() const { return belongsToSet_; }

    void link(const std::string &relation, std::shared_ptr<DataPoint> target);
    const std::map<std::string, std::vector<std::shared_ptr<DataPoint>>> &links() const { return links_; }
    void clearLinks() { links_.clear(); }

  private:
    std::string id_;
    std::string type_;
    nlohmann::json fields_;
    IndexSpec index_;
    std::optional<std::string> embeddableText_;
    std::vector<NodeSetRef> belongsToSet_;
    std::map<std::string, std::vector<std::shared_ptr<DataPoint>>> links_;
  };

  // JSON snapshot of a data point. Linked points are embedded recursively;
  // a point already on the current path is written as {"id", "type"} only,
  // so cyclic link graphs terminate.
  nlohmann::json serialize_data_point(const DataPoint &point);

  // text form of a JSON field value as it is fed to the embedding engine
  std::string field_text(const nlohmann::json &value);

} // namespace quasar
