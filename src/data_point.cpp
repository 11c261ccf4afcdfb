#include "data_point.hpp"
#include "encode.hpp"
#include "errors.hpp"
#include <unordered_set>
#include <utility>

namespace quasar
{

  namespace
  {
    const char *const kReservedKeys[] = {"id", "type", "metadata", "belongs_to_set"};

    nlohmann::json serialize_walk(const DataPoint &point, std::unordered_set<const DataPoint *> &path)
    {
      nlohmann::json out = point.fields();
      out["id"] = point.id();
      out["type"] = point.type();
      out["metadata"] = {
          {"index_fields", point.index().indexFields},
          {"embeddable_fields", point.index().embeddableFields},
      };

      nlohmann::json sets = nlohmann::json::array();
      for (const auto &s : point.belongsToSet())
        sets.push_back({{"type", s.type}, {"name", s.name}});
      out["belongs_to_set"] = std::move(sets);

      path.insert(&point);
      for (const auto &[relation, targets] : point.links())
      {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto &target : targets)
        {
          if (!target)
            continue;
          if (path.count(target.get()))
            arr.push_back({{"id", target->id()}, {"type", target->type()}});
          else
            arr.push_back(serialize_walk(*target, path));
        }
        out[relation] = std::move(arr);
      }
      path.erase(&point);
      return out;
    }
  } // namespace

  std::string field_text(const nlohmann::json &value)
  {
    if (value.is_string())
      return value.get<std::string>();
    return value.dump();
  }

  DataPoint::DataPoint(std::string type, nlohmann::json fields, IndexSpec index, std::string id)
      : id_(std::move(id)), type_(std::move(type)), fields_(std::move(fields)), index_(std::move(index))
  {
    if (fields_.is_null())
      fields_ = nlohmann::json::object();
    if (!fields_.is_object())
      throw InvalidDataPoint("data point fields must be a JSON object");
    for (const char *key : kReservedKeys)
    {
      if (fields_.contains(key))
        throw InvalidDataPoint(std::string("data point field name is reserved: ") + key);
    }
    if (id_.empty())
      id_ = generate_uuid();

    if (!index_.indexFields.empty())
    {
      const auto &field = index_.indexFields.front();
      auto it = fields_.find(field);
      if (it == fields_.end() || it->is_null())
        throw InvalidDataPoint("data point " + id_ + " has no value for index field '" + field + "'");
      embeddableText_ = field_text(*it);
    }
    else if (!index_.embeddableFields.empty())
    {
      std::string text;
      for (const auto &field : index_.embeddableFields)
      {
        auto it = fields_.find(field);
        if (it == fields_.end() || it->is_null())
          continue;
        if (!text.empty())
          text.push_back(' ');
        text += field_text(*it);
      }
      if (text.empty())
        throw InvalidDataPoint("data point " + id_ + " has no values for its embeddable fields");
      embeddableText_ = std::move(text);
    }
  }

  std::string DataPoint::name() const
  {
    auto it = fields_.find("name");
    if (it != fields_.end() && it->is_string())
      return it->get<std::string>();
    return std::string();
  }

  void DataPoint::addToSet(NodeSetRef set)
  {
    belongsToSet_.push_back(std::move(set));
  }

  void DataPoint::link(const std::string &relation, std::shared_ptr<DataPoint> target)
  {
    for (const char *key : kReservedKeys)
    {
      if (relation == key)
        throw InvalidDataPoint(std::string("link name is reserved: ") + key);
    }
    if (fields_.contains(relation))
      throw InvalidDataPoint("link name collides with field: " + relation);
    links_[relation].push_back(std::move(target));
  }

  nlohmann::json serialize_data_point(const DataPoint &point)
  {
    std::unordered_set<const DataPoint *> path;
    return serialize_walk(point, path);
  }

} // namespace quasar
