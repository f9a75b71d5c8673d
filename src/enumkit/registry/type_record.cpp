#include "enumkit/registry/type_record.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "enumkit/common/bit_utils.hpp"
#include "enumkit/common/branchless.hpp"
#include "enumkit/common/internal_error.hpp"

namespace enumkit::registry {

namespace {

namespace bl = common::branchless;

auto Invalid(const TypeDescriptor& desc, const std::string& detail)
    -> std::unexpected<RegistryError> {
  return std::unexpected(
      RegistryError{
          .kind = RegistryErrorKind::kInvalidTypeDescriptor,
          .detail = fmt::format("enum '{}': {}", desc.name, detail),
      });
}

struct Entry {
  int64_t value;
  uint64_t raw;
  size_t order;
};

// Flags: the legal bits must be `length` consecutive single bits starting at
// the lowest one. Any member that is not a single bit breaks the run.
auto FlagsHaveGaps(const std::vector<int64_t>& values) -> bool {
  for (int64_t value : values) {
    auto mask = static_cast<uint64_t>(value);
    if (!bl::IsPowerOfTwo(mask).ToBool() || mask == 0) {
      return true;
    }
  }
  size_t shift = values.size() - 1;
  if (shift >= 64) {
    return true;
  }
  auto min = static_cast<uint64_t>(values.front());
  auto max = static_cast<uint64_t>(values.back());
  return (min << shift) != max;
}

// Scalars: the legal values must be a contiguous integer range.
auto ScalarsHaveGaps(const std::vector<int64_t>& values) -> bool {
  auto min = static_cast<uint64_t>(values.front());
  auto max = static_cast<uint64_t>(values.back());
  return max - min != static_cast<uint64_t>(values.size() - 1);
}

}  // namespace

auto ToString(TypeClass classification) -> std::string {
  std::string result;
  auto append = [&](TypeClass bit, const char* label) {
    if (HasClass(classification, bit)) {
      if (!result.empty()) {
        result += '|';
      }
      result += label;
    }
  };
  append(TypeClass::kFlag, "flag");
  append(TypeClass::kSigned, "signed");
  append(TypeClass::kZero, "zero");
  append(TypeClass::kGaps, "gaps");
  return result.empty() ? "none" : result;
}

auto BuildRecordDraft(const TypeDescriptor& desc)
    -> std::expected<RecordDraft, RegistryError> {
  if (desc.raw_values.empty()) {
    return Invalid(desc, "no legal values");
  }
  if (!common::IsSupportedWidth(desc.size)) {
    return Invalid(
        desc, fmt::format("unsupported storage width {} bytes", desc.size));
  }
  if (!desc.value_names.empty() &&
      desc.value_names.size() != desc.raw_values.size()) {
    return Invalid(
        desc, fmt::format(
                  "{} names for {} values", desc.value_names.size(),
                  desc.raw_values.size()));
  }

  std::vector<Entry> entries;
  entries.reserve(desc.raw_values.size());
  for (size_t i = 0; i < desc.raw_values.size(); ++i) {
    uint64_t raw = desc.raw_values[i];
    if (!common::FitsWidth(raw, desc.size, desc.is_signed)) {
      return Invalid(
          desc, fmt::format(
                    "value {:#x} does not fit {} {}-byte storage", raw,
                    desc.is_signed ? "signed" : "unsigned", desc.size));
    }
    entries.push_back(
        Entry{
            .value = static_cast<int64_t>(
                common::CanonicalizeRaw(raw, desc.size, desc.is_signed)),
            .raw = raw,
            .order = i,
        });
  }

  std::ranges::sort(entries, [](const Entry& a, const Entry& b) {
    return a.value != b.value ? a.value < b.value : a.order < b.order;
  });

  RecordDraft draft{
      .name = desc.name,
      .identity = desc.ResolvedIdentity(),
      .size = desc.size,
  };
  draft.values.reserve(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    const Entry& entry = entries[i];
    if (i > 0 && entries[i - 1].value == entry.value) {
      if (entries[i - 1].raw != entry.raw) {
        return Invalid(
            desc, fmt::format(
                      "distinct values {:#x} and {:#x} both map to {}",
                      entries[i - 1].raw, entry.raw, entry.value));
      }
      continue;
    }
    draft.values.push_back(entry.value);
    if (!desc.value_names.empty()) {
      draft.value_names.push_back(desc.value_names[entry.order]);
    }
  }

  TypeClass classification = TypeClass::kNone;
  if (desc.is_flags) {
    classification = classification | TypeClass::kFlag;
  }
  if (desc.is_signed) {
    classification = classification | TypeClass::kSigned;
  }
  for (int64_t value : draft.values) {
    draft.sum |= static_cast<uint64_t>(value);
    if (value == 0) {
      classification = classification | TypeClass::kZero;
    }
  }
  bool gaps = desc.is_flags ? FlagsHaveGaps(draft.values)
                            : ScalarsHaveGaps(draft.values);
  if (gaps) {
    classification = classification | TypeClass::kGaps;
  }
  draft.classification = classification;
  return draft;
}

TypeRecord::TypeRecord(
    RecordDraft draft, ValueHandle handle, const int64_t* values)
    : values_(values),
      length_(static_cast<uint32_t>(draft.values.size())),
      sum_(draft.sum),
      identity_(draft.identity),
      size_(draft.size),
      classification_(draft.classification),
      handle_(handle),
      name_(std::move(draft.name)),
      value_names_(std::move(draft.value_names)) {
  if (values_ == nullptr || length_ == 0) {
    throw common::InternalError(
        "TypeRecord", fmt::format("record '{}' has no value table", name_));
  }
  if (identity_ == kSentinelIdentity) {
    throw common::InternalError(
        "TypeRecord",
        fmt::format("record '{}' uses the sentinel identity", name_));
  }
}

auto TypeRecord::Min() const -> int64_t {
  return values_[0];
}

auto TypeRecord::Max() const -> int64_t {
  return values_[bl::Max<int32_t>(Length() - 1, 0)];
}

auto TypeRecord::Default() const -> int64_t {
  return bl::IfElse(bl::Binary(HasZero()), int64_t{0}, Min());
}

auto TypeRecord::NameAt(int32_t index) const -> std::string_view {
  if (index < 0 || static_cast<size_t>(index) >= value_names_.size()) {
    return {};
  }
  return value_names_[static_cast<size_t>(index)];
}

}  // namespace enumkit::registry
