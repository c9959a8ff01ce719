#include "capture_format.hpp"

#include <cstdio>
#include <filesystem>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>

#include "internal/util/errors.hpp"

namespace flashback::stream::capture {

namespace pb = flashback::capture::v1;

namespace {

// longest varint CodedInputStream reads
constexpr std::uint64_t kMaxPrefixBytes = 10;

model::Value ToModelValue(const pb::Value& v) {
  switch (v.kind_case()) {
    case pb::Value::kBoolValue:
      return v.bool_value();
    case pb::Value::kIntValue:
      return static_cast<std::int64_t>(v.int_value());
    case pb::Value::kUintValue:
      return static_cast<std::uint64_t>(v.uint_value());
    case pb::Value::kDoubleValue:
      return v.double_value();
    case pb::Value::kDecimalValue:
      return model::Decimal{v.decimal_value()};
    case pb::Value::kTextValue:
      return model::Text{v.text_value()};
    case pb::Value::kBinaryValue:
      return model::Binary{v.binary_value()};
    case pb::Value::kTemporalMicros:
      return model::Temporal{v.temporal_micros()};
    case pb::Value::kNullValue:
    case pb::Value::KIND_NOT_SET:
      break;
  }
  return model::Null{};
}

void ToRecordValue(const model::Value& value, pb::Value* out) {
  switch (model::KindOf(value)) {
    case model::ValueKind::kNull:
      out->set_null_value(true);
      break;
    case model::ValueKind::kBoolean:
      out->set_bool_value(std::get<bool>(value));
      break;
    case model::ValueKind::kInteger:
      out->set_int_value(std::get<std::int64_t>(value));
      break;
    case model::ValueKind::kUnsigned:
      out->set_uint_value(std::get<std::uint64_t>(value));
      break;
    case model::ValueKind::kDouble:
      out->set_double_value(std::get<double>(value));
      break;
    case model::ValueKind::kDecimal:
      out->set_decimal_value(std::get<model::Decimal>(value).digits);
      break;
    case model::ValueKind::kText:
      out->set_text_value(std::get<model::Text>(value).value);
      break;
    case model::ValueKind::kBinary:
      out->set_binary_value(std::get<model::Binary>(value).bytes);
      break;
    case model::ValueKind::kTemporal:
      out->set_temporal_micros(std::get<model::Temporal>(value).micros);
      break;
  }
}

model::RowImage ToModelRow(const pb::Row& row) {
  model::RowImage image;
  image.reserve(static_cast<std::size_t>(row.values_size()));
  for (const auto& v : row.values()) {
    image.push_back(ToModelValue(v));
  }
  return image;
}

void ToRecordRow(const model::RowImage& image, pb::Row* out) {
  for (const auto& v : image) {
    ToRecordValue(v, out->add_values());
  }
}

} // namespace

std::string FileName(const std::string& prefix, std::uint32_t index) {
  char suffix[16];
  std::snprintf(suffix, sizeof(suffix), ".%06u", index);
  return prefix + suffix;
}

std::optional<std::uint32_t> ParseFileIndex(const std::string& prefix, const std::string& name) {
  if (name.size() != prefix.size() + 7 || name.compare(0, prefix.size(), prefix) != 0 || name[prefix.size()] != '.') {
    return std::nullopt;
  }

  std::uint32_t index = 0;
  for (std::size_t i = prefix.size() + 1; i < name.size(); ++i) {
    if (name[i] < '0' || name[i] > '9') {
      return std::nullopt;
    }
    index = index * 10 + static_cast<std::uint32_t>(name[i] - '0');
  }
  return index;
}

// ------------------------------------------------------------
// Record <-> model
// ------------------------------------------------------------

model::ChangeEvent ToModel(const pb::ChangeEvent& record, model::Coordinate coordinate) {
  model::ChangeEvent event;
  event.coordinate   = std::move(coordinate);
  event.timestamp_ms = record.timestamp_ms();

  switch (record.body_case()) {
    case pb::ChangeEvent::kTableDefine: {
      const auto& d = record.table_define();
      event.body    = model::TableDefine{d.table_id(), d.database(), d.table(), d.column_count()};
      break;
    }
    case pb::ChangeEvent::kInsert: {
      model::RowInsert insert;
      insert.table_id = record.insert().table_id();
      for (const auto& row : record.insert().rows()) {
        insert.rows.push_back(ToModelRow(row));
      }
      event.body = std::move(insert);
      break;
    }
    case pb::ChangeEvent::kDelete: {
      model::RowDelete del;
      del.table_id = record.delete_().table_id();
      for (const auto& row : record.delete_().rows()) {
        del.rows.push_back(ToModelRow(row));
      }
      event.body = std::move(del);
      break;
    }
    case pb::ChangeEvent::kUpdate: {
      model::RowUpdate update;
      update.table_id = record.update().table_id();
      for (const auto& pair : record.update().rows()) {
        update.rows.emplace_back(ToModelRow(pair.before()), ToModelRow(pair.after()));
      }
      event.body = std::move(update);
      break;
    }
    case pb::ChangeEvent::kMarker:
      event.body = model::Marker{record.marker().kind()};
      break;
    case pb::ChangeEvent::BODY_NOT_SET:
      event.body = model::Marker{};
      break;
  }
  return event;
}

pb::ChangeEvent ToRecord(const model::ChangeEvent& event) {
  pb::ChangeEvent record;
  record.set_timestamp_ms(event.timestamp_ms);

  if (const auto* d = std::get_if<model::TableDefine>(&event.body)) {
    auto* out = record.mutable_table_define();
    out->set_table_id(d->table_id);
    out->set_database(d->database);
    out->set_table(d->table);
    out->set_column_count(d->column_count);
  } else if (const auto* insert = std::get_if<model::RowInsert>(&event.body)) {
    auto* out = record.mutable_insert();
    out->set_table_id(insert->table_id);
    for (const auto& row : insert->rows) {
      ToRecordRow(row, out->add_rows());
    }
  } else if (const auto* del = std::get_if<model::RowDelete>(&event.body)) {
    auto* out = record.mutable_delete_();
    out->set_table_id(del->table_id);
    for (const auto& row : del->rows) {
      ToRecordRow(row, out->add_rows());
    }
  } else if (const auto* update = std::get_if<model::RowUpdate>(&event.body)) {
    auto* out = record.mutable_update();
    out->set_table_id(update->table_id);
    for (const auto& [before, after] : update->rows) {
      auto* pair = out->add_rows();
      ToRecordRow(before, pair->mutable_before());
      ToRecordRow(after, pair->mutable_after());
    }
  } else if (const auto* marker = std::get_if<model::Marker>(&event.body)) {
    record.mutable_marker()->set_kind(marker->kind);
  }
  return record;
}

// ------------------------------------------------------------
// CaptureFileReader
// ------------------------------------------------------------

CaptureFileReader::CaptureFileReader(std::string path, std::string file_name)
    : path_(std::move(path)), file_name_(std::move(file_name)), in_(path_, std::ios::binary) {
  if (!in_) {
    throw util::ConnectionError("cannot open capture file " + path_);
  }

  char magic[4] = {};
  in_.read(magic, sizeof(magic));
  if (in_.gcount() != static_cast<std::streamsize>(sizeof(magic)) || std::string_view(magic, sizeof(magic)) != kMagic) {
    throw util::ConnectionError("not a capture file: " + path_);
  }
}

void CaptureFileReader::Seek(std::uint64_t offset) {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw util::ConnectionError("cannot stat capture file " + path_ + ": " + ec.message());
  }
  if (offset < kMinimalOffset || offset > size) {
    throw util::ConnectionError("offset " + std::to_string(offset) + " outside " + file_name_ + " (size " + std::to_string(size) + ")");
  }

  in_.clear();
  in_.seekg(static_cast<std::streamoff>(offset));
  offset_ = offset;
}

CaptureFileReader::ReadStatus CaptureFileReader::Next(model::ChangeEvent* out) {
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(offset_));

  google::protobuf::io::IstreamInputStream raw(&in_);
  google::protobuf::io::CodedInputStream   coded(&raw);

  std::uint32_t length = 0;
  if (!coded.ReadVarint32(&length)) {
    std::error_code ec;
    const auto      size = std::filesystem::file_size(path_, ec);
    if (!ec && size >= offset_ + kMaxPrefixBytes) {
      error_ = "malformed length prefix at " + std::to_string(offset_);
      return ReadStatus::kCorrupt;
    }
    // empty tail, or a prefix the writer has not finished
    return ReadStatus::kEndOfData;
  }

  if (length > kMaxRecordSize) {
    error_ = "record length " + std::to_string(length) + " at " + std::to_string(offset_);
    return ReadStatus::kCorrupt;
  }

  std::string payload;
  if (!coded.ReadString(&payload, static_cast<int>(length))) {
    // writer has not finished this record yet
    return ReadStatus::kEndOfData;
  }

  flashback::capture::v1::ChangeEvent record;
  if (!record.ParseFromString(payload)) {
    error_ = "unparsable record at " + std::to_string(offset_);
    return ReadStatus::kCorrupt;
  }

  *out    = ToModel(record, model::Coordinate{file_name_, offset_});
  offset_ += static_cast<std::uint64_t>(coded.CurrentPosition());
  return ReadStatus::kEvent;
}

} // namespace flashback::stream::capture
