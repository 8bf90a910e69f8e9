// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_options.cpp
/// @brief DiffOptions construction and the value normalization policy.

#include <recdiff/diff_options.h>
#include <recdiff/errors.h>
#include <recdiff/log.h>
#include <recdiff/record_id.h>

#include <boost/locale/conversion.hpp>
#include <boost/locale/generator.hpp>
#include <boost/locale/localization_backend.hpp>
#include <boost/locale/utf.hpp>

#include <algorithm>
#include <locale>
#include <vector>

namespace recdiff {

namespace {

namespace utf = boost::locale::utf;

/// Locale for case folding and NFC, generated once from the ICU backend
/// @throws ConfigurationError if Boost.Locale was built without ICU
const std::locale& text_locale()
{
    static const std::locale loc = [] {
        auto backends = boost::locale::localization_backend_manager::global();
        const std::vector<std::string> names = backends.get_all_backends();
        if (std::find(names.begin(), names.end(), "icu") == names.end()) {
            const char* msg = "Boost.Locale has no ICU backend: case folding and NFC are unavailable";
            detail::log_diff_error("text_locale", msg);
            throw ConfigurationError(msg);
        }
        backends.select("icu");
        boost::locale::generator gen(backends);
        return gen(RECDIFF_TEXT_LOCALE);
    }();
    return loc;
}

/// Unicode White_Space, plus the information separators U+001C..U+001F
constexpr bool is_white_space(utf::code_point cp) noexcept
{
    return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) || cp == 0x85 || cp == 0xA0 ||
           cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
           cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

template <typename T>
void apply_flag(T& target, const std::optional<T>& flag)
{
    if (flag) target = *flag;
}

} // namespace

DiffOptions::DiffOptions(const DiffFlags& flags)
{
    apply_flag(ignore_ws, flags.ignore_ws);
    apply_flag(ignore_case, flags.ignore_case);
    apply_flag(unicode_normal, flags.unicode_normal);
    apply_flag(unchanged, flags.unchanged);
    apply_flag(ignore_empty_slots, flags.ignore_empty_slots);
    apply_flag(duck_type, flags.duck_type);
    apply_flag(extraneous, flags.extraneous);
    if (flags.compare_filter) compare_filter = flags.compare_filter;
    if (flags.items_equal) items_equal = flags.items_equal;
    if (flags.record_id) record_id = flags.record_id;
}

// ============================================================
// Text normalization
// ============================================================

std::string DiffOptions::normalize_whitespace(std::string_view text) const
{
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    const char* p = text.data();
    const char* const e = text.data() + text.size();
    while (p != e) {
        const char* start = p;
        const utf::code_point cp = utf::utf_traits<char>::decode(p, e);

        if (cp == utf::illegal || cp == utf::incomplete) {
            // Not UTF-8: keep the byte as it is
            p = start + 1;
        } else if (is_white_space(cp)) {
            pending_space = !result.empty();
            continue;
        }

        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.append(start, p);
    }
    return result;
}

std::string DiffOptions::normalize_case(std::string_view text) const
{
    return boost::locale::to_upper(text.data(), text.data() + text.size(), text_locale());
}

std::string DiffOptions::normalize_unf(std::string_view text) const
{
    return boost::locale::normalize(text.data(), text.data() + text.size(),
                                    boost::locale::norm_nfc, text_locale());
}

std::string DiffOptions::normalize_text(std::string_view text) const
{
    std::string result{text};
    if (ignore_ws) result = normalize_whitespace(result);
    if (ignore_case) result = normalize_case(result);
    if (unicode_normal) result = normalize_unf(result);
    return result;
}

// ============================================================
// Value normalization
// ============================================================

bool DiffOptions::value_is_empty(const Value& val) const noexcept
{
    if (val.is_null()) return true;
    if (auto* s = val.get_if<std::string>()) return s->empty();
    return false;
}

Slot DiffOptions::normalize_val(Slot val) const
{
    if (!val) return val;

    if (auto* s = val->get_if<std::string>()) {
        if (ignore_ws || ignore_case || unicode_normal) {
            val = Value{normalize_text(*s)};
        }
    }
    if (ignore_empty_slots && value_is_empty(*val)) {
        return std::nullopt;
    }
    return val;
}

Slot DiffOptions::normalize_slot(Slot val, const FieldMeta* meta) const
{
    if (val && meta && meta->compare_as) {
        val = meta->compare_as(*val);
    }
    return normalize_val(std::move(val));
}

Slot DiffOptions::normalize_item(Slot val, const CollectionType* type) const
{
    if (val && type && type->compare_item_as) {
        val = type->compare_item_as(*val);
    }
    return normalize_val(std::move(val));
}

// ============================================================
// Comparison helpers
// ============================================================

bool DiffOptions::is_filtered(const FieldSelector& fs) const
{
    return compare_filter && !compare_filter->contains(fs);
}

bool DiffOptions::items_are_equal(const Value& a, const Value& b) const
{
    if (items_equal) return items_equal(a, b);
    return a == b;
}

std::optional<MultiFieldSelector> DiffOptions::identity_selector(const FieldSelector& collection_path) const
{
    if (!compare_filter) return std::nullopt;
    return compare_filter->at(collection_path).any();
}

ItemIdentity DiffOptions::item_identity(const Value& item,
                                        const RecordType* declared_type,
                                        const MultiFieldSelector* selector,
                                        const CollectionType* container) const
{
    if (record_id) return record_id(item, declared_type, selector, *this);
    return recdiff::record_id(item, declared_type, selector, *this, container);
}

} // namespace recdiff
