#include "reclaim/cleanup/TaskStore.hpp"

#include "reclaim/util/Logger.hpp"
#include "reclaim/util/Metrics.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>

namespace reclaim::cleanup {

namespace {

int64_t toMillis(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

// Saturates instead of overflowing, so a far-future task stays pending.
TimePoint fromMillis(int64_t ms) {
  constexpr auto hi = std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::max());
  constexpr auto lo = std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::min());
  if (ms >= hi.count()) return TimePoint::max();
  if (ms <= lo.count()) return TimePoint::min();
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

std::string toJson(const rapidjson::Value& v) {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> w(buf);
  v.Accept(w);
  return std::string(buf.GetString(), buf.GetSize());
}

} // namespace

std::string newCleanupId() {
  static const uint64_t processRandom = [] {
    std::random_device rd;
    return ((static_cast<uint64_t>(rd()) << 32) | rd()) & 0xFFFFFFFFFFull;
  }();
  static std::atomic<uint32_t> counter{[] {
    std::random_device rd;
    return static_cast<uint32_t>(rd());
  }()};

  const auto secs = static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch()).count());
  const uint32_t seq = counter.fetch_add(1, std::memory_order_relaxed) & 0xFFFFFFu;

  char buf[25];
  std::snprintf(buf, sizeof(buf), "%08x%010llx%06x",
                secs, static_cast<unsigned long long>(processRandom), seq);
  return std::string(buf, 24);
}

std::string encodeCleanupDoc(const CleanupDoc& doc) {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> w(buf);
  w.StartObject();
  w.Key("_id");    w.String(doc.id.c_str(), static_cast<rapidjson::SizeType>(doc.id.size()));
  w.Key("kind");   w.String(doc.kind.c_str(), static_cast<rapidjson::SizeType>(doc.kind.size()));
  if (doc.when) {
    w.Key("when"); w.Int64(toMillis(*doc.when));
  }
  w.Key("prefix"); w.String(doc.prefix.c_str(), static_cast<rapidjson::SizeType>(doc.prefix.size()));
  if (!doc.args.empty()) {
    w.Key("args");
    w.StartArray();
    for (const auto& a : doc.args) w.RawValue(a.c_str(), a.size(), rapidjson::kObjectType);
    w.EndArray();
  }
  w.EndObject();
  return std::string(buf.GetString(), buf.GetSize());
}

Result<CleanupDoc> decodeCleanupDoc(const store::Document& raw) {
  rapidjson::Document d;
  d.Parse(raw.json.c_str(), raw.json.size());
  if (d.HasParseError() || !d.IsObject()) {
    return makeError(Errc::InvalidArgument, "malformed cleanup document", raw.id);
  }

  CleanupDoc doc;
  doc.id = raw.id;

  if (!d.HasMember("kind") || !d["kind"].IsString()) {
    return makeError(Errc::InvalidArgument, "cleanup document has no kind", raw.id);
  }
  doc.kind = d["kind"].GetString();

  if (d.HasMember("prefix")) {
    if (!d["prefix"].IsString()) return makeError(Errc::InvalidArgument, "cleanup prefix must be a string", raw.id);
    doc.prefix = d["prefix"].GetString();
  }

  if (d.HasMember("when")) {
    if (!d["when"].IsInt64()) return makeError(Errc::InvalidArgument, "cleanup when must be an integer", raw.id);
    doc.when = fromMillis(d["when"].GetInt64());
  }

  if (d.HasMember("args")) {
    const auto& args = d["args"];
    if (!args.IsArray()) return makeError(Errc::InvalidArgument, "cleanup args must be an array", raw.id);
    for (const auto& a : args.GetArray()) doc.args.push_back(toJson(a));
  }
  return doc;
}

Result<CleanupTask> decodeTask(const CleanupDoc& doc) {
  auto kind = parseCleanupKind(doc.kind);
  if (!kind) {
    return makeError(Errc::UnknownKind, "unknown cleanup kind \"" + doc.kind + "\"", doc.id);
  }
  auto args = decodeArgs(*kind, doc.args);
  if (!args) return args.error();

  CleanupTask task;
  task.id = doc.id;
  task.kind = *kind;
  task.prefix = doc.prefix;
  task.dueAt = doc.when.value_or(asap);
  task.args = std::move(*args);
  return task;
}

store::TxnOp newCleanupOp(CleanupKind kind, const std::string& prefix, std::vector<RawArg> args) {
  return newCleanupAtOp(asap, kind, prefix, std::move(args));
}

store::TxnOp newCleanupAtOp(TimePoint when, CleanupKind kind, const std::string& prefix,
                            std::vector<RawArg> args) {
  CleanupDoc doc;
  doc.id = newCleanupId();
  doc.kind = toString(kind);
  doc.when = when;
  doc.prefix = prefix;
  doc.args = std::move(args);

  store::TxnOp op;
  op.collection = kCleanupsCollection;
  op.id = doc.id;
  op.precondition = store::Assert::DocMissing;
  op.insert = encodeCleanupDoc(doc);
  return op;
}

Status TaskStore::enqueue(CleanupKind kind, const std::string& prefix, std::vector<RawArg> args) {
  return enqueueAt(asap, kind, prefix, std::move(args));
}

Status TaskStore::enqueueAt(TimePoint when, CleanupKind kind, const std::string& prefix,
                            std::vector<RawArg> args) {
  Status st = _db.runTransaction({newCleanupAtOp(when, kind, prefix, std::move(args))});
  if (!st) return annotate(st, std::string("cannot schedule ") + toString(kind) + " cleanup");
  RECLAIM_METRIC_HIT("cleanup.scheduled");
  return {};
}

Result<bool> TaskStore::hasPending() const {
  auto n = _db.count(kCleanupsCollection);
  if (!n) return n.error();
  return *n > 0;
}

Result<std::size_t> TaskStore::pendingCount() const {
  return _db.count(kCleanupsCollection);
}

Result<std::vector<CleanupDoc>> TaskStore::all() const {
  auto docs = _db.find(kCleanupsCollection);
  if (!docs) return annotate(docs.error(), "reading cleanup documents");

  std::vector<CleanupDoc> out;
  out.reserve(docs->size());
  for (const auto& raw : *docs) {
    auto doc = decodeCleanupDoc(raw);
    if (!doc) {
      // Keep it visible: the dispatcher reports it and leaves it pending.
      util::logger().log(util::LogLevel::Warn, "cleanup.doc.unreadable",
                         {{"id", raw.id}, {"error", doc.error().describe()}});
      CleanupDoc broken;
      broken.id = raw.id;
      out.push_back(std::move(broken));
      continue;
    }
    out.push_back(std::move(*doc));
  }
  return out;
}

Result<std::vector<CleanupDoc>> TaskStore::due(TimePoint now) const {
  auto docs = all();
  if (!docs) return docs.error();

  std::vector<CleanupDoc> out;
  for (auto& doc : *docs) {
    if (!doc.when || *doc.when <= now) out.push_back(std::move(doc));
  }
  std::sort(out.begin(), out.end(), [](const CleanupDoc& a, const CleanupDoc& b) {
    const TimePoint wa = a.when.value_or(asap);
    const TimePoint wb = b.when.value_or(asap);
    if (wa != wb) return wa < wb;
    return a.id < b.id;
  });
  return out;
}

Status TaskStore::remove(const std::string& id) {
  store::TxnOp op;
  op.collection = kCleanupsCollection;
  op.id = id;
  op.precondition = store::Assert::DocExists;
  op.remove = true;

  Status st = _db.runTransaction({op});
  if (st.is(Errc::TxnAborted)) {
    util::logger().log(util::LogLevel::Debug, "cleanup document already removed", {{"id", id}});
    return {};
  }
  return st;
}

} // namespace reclaim::cleanup
