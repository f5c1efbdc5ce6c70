#include "reclaim/cleanup/CleanupArgs.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace reclaim::cleanup {

namespace {

constexpr const char* kDestroyStorageKey = "destroy-storage";
constexpr const char* kForceKey          = "force";
constexpr const char* kMaxWaitKey        = "max-wait";

RawArg boolArg(bool b) { return b ? "true" : "false"; }

Status unmarshalBool(const RawArg& raw, const char* name, bool& out) {
  rapidjson::Document d;
  d.Parse(raw.c_str(), raw.size());
  if (d.HasParseError() || !d.IsBool()) {
    return makeError(Errc::InvalidArgument,
                     std::string("unmarshalling cleanup arg '") + name + "': expected boolean, got " + raw);
  }
  out = d.GetBool();
  return {};
}

Result<CleanupArgs> unmarshalModelParams(const RawArg& raw) {
  rapidjson::Document d;
  d.Parse(raw.c_str(), raw.size());
  if (d.HasParseError() || !d.IsObject()) {
    return makeError(Errc::InvalidArgument, "unmarshalling cleanup args: expected object, got " + raw);
  }

  state::DestroyModelParams p;
  if (d.HasMember(kDestroyStorageKey)) {
    const auto& v = d[kDestroyStorageKey];
    if (!v.IsBool()) return makeError(Errc::InvalidArgument, "unmarshalling cleanup args: destroy-storage must be boolean");
    p.destroyStorage = v.GetBool();
  }
  if (d.HasMember(kForceKey)) {
    const auto& v = d[kForceKey];
    if (!v.IsBool()) return makeError(Errc::InvalidArgument, "unmarshalling cleanup args: force must be boolean");
    p.force = v.GetBool();
  }
  if (d.HasMember(kMaxWaitKey)) {
    const auto& v = d[kMaxWaitKey];
    if (!v.IsInt64() || v.GetInt64() < 0) {
      return makeError(Errc::InvalidArgument, "unmarshalling cleanup args: max-wait must be a non-negative integer");
    }
    p.maxWait = std::chrono::milliseconds(v.GetInt64());
  }
  return CleanupArgs{p};
}

Status checkCount(CleanupKind kind, std::size_t n) {
  const std::size_t max = maxArgs(kind);
  if (n <= max) return {};
  if (max == 0) {
    return makeError(Errc::InvalidArgument, "expected 0 arguments, got " + std::to_string(n));
  }
  return makeError(Errc::InvalidArgument,
                   "expected 0-" + std::to_string(max) + " arguments, got " + std::to_string(n));
}

} // namespace

std::vector<RawArg> encodeArgs(const UnitDestroyArgs& a) {
  return {boolArg(a.destroyStorage), boolArg(a.force)};
}

std::vector<RawArg> encodeArgs(const ForceArgs& a) {
  return {boolArg(a.force)};
}

std::vector<RawArg> encodeArgs(const ModelStorageArgs& a) {
  return {boolArg(a.destroyStorage), boolArg(a.force)};
}

std::vector<RawArg> encodeArgs(const state::DestroyModelParams& p) {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> w(buf);
  w.StartObject();
  if (p.destroyStorage) { w.Key(kDestroyStorageKey); w.Bool(*p.destroyStorage); }
  if (p.force)          { w.Key(kForceKey);          w.Bool(*p.force); }
  if (p.maxWait)        { w.Key(kMaxWaitKey);        w.Int64(p.maxWait->count()); }
  w.EndObject();
  return {RawArg(buf.GetString(), buf.GetSize())};
}

std::size_t maxArgs(CleanupKind kind) {
  switch (kind) {
    case CleanupKind::UnitsForDyingApplication:
    case CleanupKind::DyingUnit:
    case CleanupKind::StorageForDyingModel:
      return 2;
    case CleanupKind::RemovedUnit:
    case CleanupKind::DyingMachine:
    case CleanupKind::AttachmentsForDyingStorage:
    case CleanupKind::DyingUnitResources:
    case CleanupKind::ModelsForDyingController:
      return 1;
    case CleanupKind::RelationSettings:
    case CleanupKind::Charm:
    case CleanupKind::ForceDestroyedUnit:
    case CleanupKind::ForceRemoveUnit:
    case CleanupKind::ApplicationsForDyingModel:
    case CleanupKind::ForceDestroyedMachine:
    case CleanupKind::AttachmentsForDyingVolume:
    case CleanupKind::AttachmentsForDyingFilesystem:
    case CleanupKind::MachinesForDyingModel:
    case CleanupKind::ResourceBlob:
      return 0;
  }
  return 0;
}

Result<CleanupArgs> decodeArgs(CleanupKind kind, const std::vector<RawArg>& raw) {
  Status st = checkCount(kind, raw.size());
  if (!st) return st.error();
  if (raw.empty()) return CleanupArgs{LegacyArgs{}};

  const std::size_t n = raw.size();
  switch (kind) {
    case CleanupKind::UnitsForDyingApplication:
    case CleanupKind::DyingUnit: {
      UnitDestroyArgs a;
      if (n >= 1 && !(st = unmarshalBool(raw[0], "destroyStorage", a.destroyStorage))) return st.error();
      if (n >= 2 && !(st = unmarshalBool(raw[1], "force", a.force))) return st.error();
      return CleanupArgs{a};
    }
    case CleanupKind::StorageForDyingModel: {
      ModelStorageArgs a;
      if (n >= 1 && !(st = unmarshalBool(raw[0], "destroyStorage", a.destroyStorage))) return st.error();
      if (n >= 2 && !(st = unmarshalBool(raw[1], "force", a.force))) return st.error();
      return CleanupArgs{a};
    }
    case CleanupKind::RemovedUnit:
    case CleanupKind::DyingMachine:
    case CleanupKind::AttachmentsForDyingStorage:
    case CleanupKind::DyingUnitResources: {
      ForceArgs a;
      if (!(st = unmarshalBool(raw[0], "force", a.force))) return st.error();
      return CleanupArgs{a};
    }
    case CleanupKind::ModelsForDyingController:
      return unmarshalModelParams(raw[0]);
    default:
      break;
  }
  return CleanupArgs{LegacyArgs{}};
}

} // namespace reclaim::cleanup
