#include "reclaim/store/MemDatabase.hpp"

#include "reclaim/util/Logger.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace reclaim::store {

namespace {

Status checkObject(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError()) {
    return makeError(Errc::InvalidArgument,
                     std::string("malformed document: ") + rapidjson::GetParseError_En(doc.GetParseError()));
  }
  if (!doc.IsObject()) {
    return makeError(Errc::InvalidArgument, "document must be a JSON object");
  }
  return {};
}

std::string toJson(const rapidjson::Value& v) {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> w(buf);
  v.Accept(w);
  return std::string(buf.GetString(), buf.GetSize());
}

} // namespace

Result<std::unique_ptr<MemDatabase>> MemDatabase::open(const std::string& snapshotPath) {
  auto db = std::make_unique<MemDatabase>();
  db->path_ = snapshotPath;
  if (!snapshotPath.empty()) {
    Status st = db->load();
    if (!st) return annotate(st.error(), "opening snapshot " + snapshotPath);
  }
  return db;
}

Status MemDatabase::runTransaction(const std::vector<TxnOp>& ops) {
  std::lock_guard<std::mutex> lk(mx_);

  // Stage copies of the touched collections; nothing is visible until every
  // op has passed its assertions.
  Collections staged;
  auto coll = [&](const std::string& name) -> Collection& {
    auto it = staged.find(name);
    if (it == staged.end()) {
      auto cur = data_.find(name);
      it = staged.emplace(name, cur == data_.end() ? Collection{} : cur->second).first;
    }
    return it->second;
  };

  for (const auto& op : ops) {
    if (op.collection.empty() || op.id.empty()) {
      return makeError(Errc::InvalidArgument, "transaction op needs a collection and an id");
    }
    if (op.insert && op.remove) {
      return makeError(Errc::InvalidArgument, "cannot insert and remove in one op", op.id);
    }

    auto& c = coll(op.collection);
    const bool exists = c.count(op.id) != 0;
    if (op.precondition == Assert::DocExists && !exists) {
      return makeError(Errc::TxnAborted, "document missing", op.collection + "/" + op.id);
    }
    if (op.precondition == Assert::DocMissing && exists) {
      return makeError(Errc::TxnAborted, "document already exists", op.collection + "/" + op.id);
    }

    if (op.insert) {
      if (exists) {
        return makeError(Errc::TxnAborted, "document already exists", op.collection + "/" + op.id);
      }
      Status st = checkObject(*op.insert);
      if (!st) return annotate(st.error(), op.collection + "/" + op.id);
      c[op.id] = *op.insert;
    } else if (op.remove) {
      c.erase(op.id);
    }
  }

  if (path_.empty()) {
    for (auto& kv : staged) data_[kv.first] = std::move(kv.second);
    return {};
  }

  Collections next = data_;
  for (auto& kv : staged) next[kv.first] = std::move(kv.second);
  Status st = save(next);
  if (!st) return st;
  data_ = std::move(next);
  return {};
}

Result<std::vector<Document>> MemDatabase::find(const std::string& collection) const {
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<Document> out;
  auto it = data_.find(collection);
  if (it == data_.end()) return out;
  out.reserve(it->second.size());
  for (const auto& kv : it->second) out.push_back(Document{kv.first, kv.second});
  return out;
}

Result<std::size_t> MemDatabase::count(const std::string& collection) const {
  std::lock_guard<std::mutex> lk(mx_);
  auto it = data_.find(collection);
  return it == data_.end() ? std::size_t{0} : it->second.size();
}

Status MemDatabase::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) return {};   // fresh database

  std::ifstream in(path_, std::ios::binary);
  if (!in) return makeError(Errc::Unavailable, "cannot read snapshot", path_);
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  rapidjson::Document doc;
  doc.Parse(text.c_str(), text.size());
  if (doc.HasParseError()) {
    return makeError(Errc::InvalidArgument,
                     std::string("corrupt snapshot: ") + rapidjson::GetParseError_En(doc.GetParseError()), path_);
  }
  if (!doc.IsObject() || !doc.HasMember("collections") || !doc["collections"].IsObject()) {
    return makeError(Errc::InvalidArgument, "snapshot has no collections object", path_);
  }

  Collections data;
  for (auto& coll : doc["collections"].GetObject()) {
    if (!coll.value.IsObject()) {
      return makeError(Errc::InvalidArgument, "collection is not an object", coll.name.GetString());
    }
    auto& c = data[coll.name.GetString()];
    for (auto& d : coll.value.GetObject()) {
      c[d.name.GetString()] = toJson(d.value);
    }
  }
  data_ = std::move(data);

  util::logger().log(util::LogLevel::Debug, "snapshot loaded",
                     {{"path", path_}, {"collections", std::to_string(data_.size())}});
  return {};
}

Status MemDatabase::save(const Collections& data) const {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> w(buf);
  w.StartObject();
  w.Key("collections");
  w.StartObject();
  for (const auto& coll : data) {
    w.Key(coll.first.c_str(), static_cast<rapidjson::SizeType>(coll.first.size()));
    w.StartObject();
    for (const auto& d : coll.second) {
      w.Key(d.first.c_str(), static_cast<rapidjson::SizeType>(d.first.size()));
      w.RawValue(d.second.c_str(), d.second.size(), rapidjson::kObjectType);
    }
    w.EndObject();
  }
  w.EndObject();
  w.EndObject();

  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return makeError(Errc::Unavailable, "cannot write snapshot", tmp);
    out.write(buf.GetString(), static_cast<std::streamsize>(buf.GetSize()));
    out.flush();
    if (!out) return makeError(Errc::Unavailable, "short write to snapshot", tmp);
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) return makeError(Errc::Unavailable, "cannot replace snapshot: " + ec.message(), path_);
  return {};
}

} // namespace reclaim::store
