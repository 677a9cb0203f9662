/**
 * @file skills/payload/PayloadCodec.hpp
 * @brief FlatBuffers codec for the SkillRequest envelope.
 *
 * Collaborators that hand payloads across a process or thread boundary send
 * a serialized SkillRequest (skill_payload.fbs): a skill id or trigger phrase
 * plus one tagged-union entry per payload field.
 */
#pragma once

#include "Payload.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace SkillRuntime::Skills {

/**
 * @brief Decoded SkillRequest envelope.
 */
struct DecodedSkillRequest {
    std::string skill_id;   ///< Empty when the request selects by trigger
    std::string trigger;    ///< Empty when the request selects by id
    Payload payload;
};

/**
 * @brief Serialize a skill invocation into a SkillRequest buffer.
 * @param skill_id Target skill id (may be empty when @p trigger is set).
 * @param payload Payload fields.
 * @param trigger Optional trigger phrase.
 * @return Finished FlatBuffer bytes.
 */
[[nodiscard]] std::vector<uint8_t> encode_skill_request(
    const std::string& skill_id,
    const Payload& payload,
    const std::string& trigger = ""
);

/**
 * @brief Verify and decode a SkillRequest buffer.
 *
 * Runs the FlatBuffers verifier before touching the data.
 *
 * @param bytes Raw buffer.
 * @return Decoded request, or std::nullopt if the buffer fails verification
 *         or names neither a skill id nor a trigger.
 */
[[nodiscard]] std::optional<DecodedSkillRequest> decode_skill_request(
    std::span<const uint8_t> bytes
);

} // namespace SkillRuntime::Skills
