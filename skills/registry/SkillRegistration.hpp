/**
 * @file skills/registry/SkillRegistration.hpp
 * @brief Immutable registration bundle stored by the SkillRegistry.
 *
 * A registration pairs a descriptor (and therefore its runner) with the
 * trigger phrases that reach it. Registrations are never modified after
 * construction; re-registering an id swaps in a new bundle.
 */
#pragma once

#include "SkillDescriptor.hpp"

#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace SkillRuntime::Skills {

/**
 * @brief Type-erased part of a registration.
 *
 * The registry stores registrations through this base so skills over
 * different (Payload, Features, Output) triples can live side by side.
 */
class SkillRegistrationBase {
public:
    virtual ~SkillRegistrationBase() = default;

    SkillRegistrationBase(const SkillRegistrationBase&) = delete;
    SkillRegistrationBase& operator=(const SkillRegistrationBase&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    /// @brief Normalized trigger phrases.
    [[nodiscard]] const std::vector<std::string>& triggers() const noexcept { return triggers_; }

    /// @brief Payload type the descriptor accepts (diagnostics).
    [[nodiscard]] virtual std::type_index payload_type() const noexcept = 0;

protected:
    SkillRegistrationBase(std::string id, std::vector<std::string> triggers)
        : id_(std::move(id))
        , triggers_(std::move(triggers)) {}

private:
    std::string id_;
    std::vector<std::string> triggers_;
};

/**
 * @brief Registration for one concrete (Payload, Features, Output) triple.
 */
template<typename PayloadT, typename Features, typename Output>
class SkillRegistration final : public SkillRegistrationBase {
public:
    using Descriptor = ISkillDescriptor<PayloadT, Features, Output>;
    using Runner = ISkillRunner<Features, Output>;

    SkillRegistration(
        std::string id,
        std::shared_ptr<Descriptor> descriptor,
        std::vector<std::string> triggers
    )
        : SkillRegistrationBase(std::move(id), std::move(triggers))
        , descriptor_(std::move(descriptor))
        , runner_(descriptor_ ? descriptor_->runner() : nullptr) {}

    [[nodiscard]] const std::shared_ptr<Descriptor>& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] const std::shared_ptr<Runner>& runner() const noexcept { return runner_; }

    [[nodiscard]] std::type_index payload_type() const noexcept override {
        return std::type_index(typeid(PayloadT));
    }

private:
    std::shared_ptr<Descriptor> descriptor_;
    std::shared_ptr<Runner> runner_;
};

} // namespace SkillRuntime::Skills
