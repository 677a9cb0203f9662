/**
 * @file skills/payload/PayloadCodec.cpp
 * @brief SkillRequest encode/decode.
 */
#include "PayloadCodec.hpp"
#include "skill_payload_generated.h"

#include <flatbuffers/flatbuffers.h>

namespace SkillRuntime::Skills {
namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

flatbuffers::Offset<Wire::Entry> encode_entry(
    flatbuffers::FlatBufferBuilder& builder,
    const std::string& key,
    const PayloadValue& value
) {
    auto key_offset = builder.CreateString(key);
    return std::visit(overloaded{
        [&](double v) {
            auto inner = Wire::CreateNumberValue(builder, v);
            return Wire::CreateEntry(builder, key_offset, Wire::Value_NumberValue, inner.Union());
        },
        [&](const std::string& v) {
            auto text = builder.CreateString(v);
            auto inner = Wire::CreateTextValue(builder, text);
            return Wire::CreateEntry(builder, key_offset, Wire::Value_TextValue, inner.Union());
        },
        [&](bool v) {
            auto inner = Wire::CreateBoolValue(builder, v);
            return Wire::CreateEntry(builder, key_offset, Wire::Value_BoolValue, inner.Union());
        },
        [&](const std::vector<std::string>& v) {
            auto items = builder.CreateVectorOfStrings(v);
            auto inner = Wire::CreateTextListValue(builder, items);
            return Wire::CreateEntry(builder, key_offset, Wire::Value_TextListValue, inner.Union());
        }
    }, value);
}

std::optional<PayloadValue> decode_value(const Wire::Entry& entry) {
    if (entry.value() == nullptr) {
        return std::nullopt;
    }
    switch (entry.value_type()) {
        case Wire::Value_NumberValue:
            return PayloadValue{entry.value_as_NumberValue()->value()};
        case Wire::Value_TextValue: {
            auto text = entry.value_as_TextValue()->value();
            return PayloadValue{text ? text->str() : std::string{}};
        }
        case Wire::Value_BoolValue:
            return PayloadValue{entry.value_as_BoolValue()->value()};
        case Wire::Value_TextListValue: {
            std::vector<std::string> items;
            auto values = entry.value_as_TextListValue()->values();
            if (values) {
                items.reserve(values->size());
                for (const auto* item : *values) {
                    items.push_back(item ? item->str() : std::string{});
                }
            }
            return PayloadValue{std::move(items)};
        }
        default:
            return std::nullopt;
    }
}

} // anonymous namespace

std::vector<uint8_t> encode_skill_request(
    const std::string& skill_id,
    const Payload& payload,
    const std::string& trigger
) {
    flatbuffers::FlatBufferBuilder builder(256 + payload.size() * 32);

    std::vector<flatbuffers::Offset<Wire::Entry>> entries;
    entries.reserve(payload.size());
    for (const auto& [key, value] : payload) {
        entries.push_back(encode_entry(builder, key, value));
    }

    auto id_offset = builder.CreateString(skill_id);
    auto trigger_offset = builder.CreateString(trigger);
    auto entries_offset = builder.CreateVector(entries);
    auto request = Wire::CreateSkillRequest(builder, id_offset, trigger_offset, entries_offset);
    builder.Finish(request);

    return std::vector<uint8_t>(
        builder.GetBufferPointer(),
        builder.GetBufferPointer() + builder.GetSize()
    );
}

std::optional<DecodedSkillRequest> decode_skill_request(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return std::nullopt;
    }
    flatbuffers::Verifier verifier(bytes.data(), bytes.size());
    if (!Wire::VerifySkillRequestBuffer(verifier)) {
        return std::nullopt;
    }

    auto request = Wire::GetSkillRequest(bytes.data());
    DecodedSkillRequest decoded;
    if (request->skill_id()) {
        decoded.skill_id = request->skill_id()->str();
    }
    if (request->trigger()) {
        decoded.trigger = request->trigger()->str();
    }
    if (decoded.skill_id.empty() && decoded.trigger.empty()) {
        return std::nullopt;
    }

    if (auto entries = request->entries()) {
        for (const auto* entry : *entries) {
            // Entries with an unknown union member are dropped like any unreadable field.
            auto value = decode_value(*entry);
            if (value) {
                decoded.payload.insert_or_assign(entry->key()->str(), std::move(*value));
            }
        }
    }
    return decoded;
}

} // namespace SkillRuntime::Skills
