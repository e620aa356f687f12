#include "record_normalizer.hpp"

#include <google/protobuf/util/json_util.h>

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <string_view>

#include "internal/ingest/literal_decoder.hpp"
#include "internal/util/strings.hpp"

namespace tripgraph::ingest {

namespace {

using google::protobuf::Value;

struct ActivityField {
  std::string_view    key;
  graph::ActivityKind kind;
  graph::MealSlot     meal_slot;
};

// Order in which activity nodes are created for a day.
constexpr std::array<ActivityField, 6> kActivityFields = {{
    {"transportation", graph::ActivityKind::kTransportation, graph::MealSlot::kNone},
    {"breakfast", graph::ActivityKind::kMeal, graph::MealSlot::kBreakfast},
    {"lunch", graph::ActivityKind::kMeal, graph::MealSlot::kLunch},
    {"dinner", graph::ActivityKind::kMeal, graph::MealSlot::kDinner},
    {"attraction", graph::ActivityKind::kAttraction, graph::MealSlot::kNone},
    {"accommodation", graph::ActivityKind::kAccommodation, graph::MealSlot::kNone},
}};

const Value* Field(const google::protobuf::Struct& raw, std::string_view key) {
  auto it = raw.fields().find(std::string(key));
  if (it == raw.fields().end() || it->second.kind_case() == Value::kNullValue) return nullptr;
  return &it->second;
}

std::string ToJson(const Value& value) {
  std::string out;
  if (!google::protobuf::util::MessageToJsonString(value, &out).ok()) return {};
  return out;
}

std::string FormatNumber(double value) {
  if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) < 9.007199254740992e15) {
    return std::to_string(static_cast<std::int64_t>(value));
  }
  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  return std::string(buf, ec == std::errc() ? end : buf);
}

// Text form of any value: strings as-is, other scalars printed, containers as JSON.
std::string ValueText(const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return value.string_value();
    case Value::kNumberValue:
      return FormatNumber(value.number_value());
    case Value::kBoolValue:
      return value.bool_value() ? "True" : "False";
    case Value::kNullValue:
    case Value::KIND_NOT_SET:
      return {};
    default:
      return ToJson(value);
  }
}

std::optional<std::int64_t> IntegralOf(double value) {
  if (!std::isfinite(value) || std::trunc(value) != value) return std::nullopt;
  if (value < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
      value >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(value);
}

std::optional<double> ParseDouble(std::string_view text) {
  text = util::Trim(text);
  if (!text.empty() && text.front() == '+') text.remove_prefix(1);
  double value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || end != text.data() + text.size()) return std::nullopt;
  return value;
}

std::optional<std::int64_t> CoerceInt(const Value& value) {
  if (value.kind_case() == Value::kNumberValue) return IntegralOf(value.number_value());
  if (value.kind_case() != Value::kStringValue) return std::nullopt;

  auto         text = util::Trim(value.string_value());
  std::int64_t out  = 0;
  auto [end, ec]    = std::from_chars(text.data(), text.data() + text.size(), out);
  if (!text.empty() && ec == std::errc() && end == text.data() + text.size()) return out;
  if (auto parsed = ParseDouble(text)) return IntegralOf(*parsed);
  return std::nullopt;
}

std::optional<double> CoerceDouble(const Value& value) {
  if (value.kind_case() == Value::kNumberValue) return value.number_value();
  if (value.kind_case() == Value::kStringValue) return ParseDouble(value.string_value());
  return std::nullopt;
}

class Normalizer {
 public:
  explicit Normalizer(const google::protobuf::Struct& raw) : raw_(raw) {
  }

  NormalizedTrip Run() {
    ReadCity("org", trip_.org);
    ReadCity("dest", trip_.dest);
    ReadInt("days", trip_.days);
    ReadInt("visiting_city_number", trip_.visiting_city_number);
    ReadText("date", trip_.date);
    ReadInt("people_number", trip_.people_number);
    ReadText("local_constraint", trip_.local_constraint);
    ReadBudget();
    ReadText("query", trip_.query);
    ReadText("level", trip_.level);

    const auto day_plans = DecodePayload("annotated_plan", trip_.annotated_plan);
    for (const auto& entry : day_plans.values()) {
      AddDayPlan(entry);
    }
    const auto references = DecodePayload("reference_information", trip_.reference_information);
    for (const auto& entry : references.values()) {
      AddReference(entry);
    }
    return std::move(trip_);
  }

 private:
  void Issue(std::string_view field, std::string reason) {
    trip_.issues.push_back({std::string(field), std::move(reason)});
  }

  void ReadCity(std::string_view key, std::string& out) {
    const auto* value = Field(raw_, key);
    if (!value) {
      Issue(key, "missing, using \"" + out + "\"");
      return;
    }
    out = ValueText(*value);
  }

  void ReadText(std::string_view key, std::string& out) {
    if (const auto* value = Field(raw_, key)) out = ValueText(*value);
  }

  void ReadInt(std::string_view key, std::int64_t& out) {
    const auto* value = Field(raw_, key);
    if (!value) return;
    if (auto parsed = CoerceInt(*value)) {
      out = *parsed;
      return;
    }
    Issue(key, "not an integer: " + ValueText(*value));
  }

  void ReadBudget() {
    const auto* value = Field(raw_, "budget");
    if (!value) return;
    if (auto parsed = CoerceDouble(*value); parsed && std::isfinite(*parsed)) {
      trip_.budget = *parsed;
      return;
    }
    Issue("budget", "not a number: " + ValueText(*value));
  }

  // Decoded entries of a nested payload; the raw text is kept in `raw_text`.
  google::protobuf::ListValue DecodePayload(std::string_view key, std::string& raw_text) {
    const auto* value = Field(raw_, key);
    if (!value) return {};

    if (value->kind_case() == Value::kListValue) {
      raw_text = ToJson(*value);
      return value->list_value();
    }
    if (value->kind_case() != Value::kStringValue) {
      raw_text = ValueText(*value);
      Issue(key, "expected encoded text or a list");
      return {};
    }

    raw_text     = value->string_value();
    auto decoded = DecodeLiteral(raw_text);
    if (!decoded.ok) {
      Issue(key, "undecodable: " + decoded.error);
      return {};
    }
    // tuples and sets decode to list values too, but only a list literal is a payload
    if (decoded.container != LiteralContainer::kList) {
      Issue(key, "decoded value is not a list");
      return {};
    }
    return std::move(*decoded.value.mutable_list_value());
  }

  void AddDayPlan(const Value& entry) {
    if (entry.kind_case() != Value::kStructValue || entry.struct_value().fields().empty()) return;
    const auto& fields = entry.struct_value();

    NormalizedDayPlan day_plan;
    if (const auto* day = Field(fields, "days")) {
      day_plan.day = CoerceInt(*day);
      if (!day_plan.day) Issue("annotated_plan.days", "not an integer: " + ValueText(*day));
    }
    if (const auto* city = Field(fields, "current_city")) day_plan.current_city = ValueText(*city);

    for (const auto& activity : kActivityFields) {
      const auto* value = Field(fields, activity.key);
      if (!value || value->kind_case() != Value::kStringValue) continue;
      if (util::IsPlaceholder(value->string_value())) continue;
      day_plan.activities.push_back({activity.kind, activity.meal_slot, value->string_value()});
    }
    trip_.day_plans.push_back(std::move(day_plan));
  }

  void AddReference(const Value& entry) {
    if (entry.kind_case() != Value::kStructValue) return;
    const auto* description = Field(entry.struct_value(), "Description");
    const auto* content     = Field(entry.struct_value(), "Content");
    if (!description || !content) return;
    trip_.references.push_back({ValueText(*description), ValueText(*content)});
  }

  const google::protobuf::Struct& raw_;
  NormalizedTrip                  trip_;
};

} // namespace

NormalizedTrip Normalize(const google::protobuf::Struct& raw) {
  return Normalizer(raw).Run();
}

} // namespace tripgraph::ingest
