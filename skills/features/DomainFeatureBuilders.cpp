/**
 * @file skills/features/DomainFeatureBuilders.cpp
 * @brief Signal layouts of the built-in domain feature builders.
 *
 * Each extractor reads a fixed, ordered list of payload fields. Scales are
 * chosen so that typical values land inside [-1, 1] before clamping.
 */
#include "FeatureBuilder.hpp"

namespace SkillRuntime::Features {
namespace {

using Skills::collection_size_of;
using Skills::flag_of;
using Skills::joined_text_of;
using Skills::number_of;
using Skills::text_of;

void append(std::vector<float>& signals, const std::vector<float>& more) {
    signals.insert(signals.end(), more.begin(), more.end());
}

std::vector<float> education_signals(const Payload& p) {
    std::vector<float> s;
    double correct = number_of(p, "correctCount").value_or(0.0);
    double incorrect = number_of(p, "incorrectCount").value_or(0.0);
    double attempts = correct + incorrect;

    s.push_back(normalize(number_of(p, "gradeLevel"), 12.0));
    s.push_back(normalize(number_of(p, "difficulty"), 10.0));
    s.push_back(normalized_length(text_of(p, "question"), 256));
    s.push_back(normalize(number_of(p, "timeRemaining"), 60.0));
    s.push_back(ratio(correct, attempts));
    s.push_back(ratio(incorrect, attempts));
    s.push_back(normalized_count(collection_size_of(p, "hints"), 10.0));
    append(s, keyword_flags(joined_text_of(p, {"topic", "question"}),
                            {"math", "science", "history", "language", "coding", "exam"}));
    append(s, formula_coefficients(text_of(p, "equation")));
    s.push_back(flag_of(p, "needsStepByStep"));
    return s;
}

std::vector<float> retail_signals(const Payload& p) {
    std::vector<float> s;
    auto price = number_of(p, "price");
    auto list_price = number_of(p, "listPrice");

    s.push_back(normalize(price, 2000.0));
    s.push_back(normalize(number_of(p, "discount"), 100.0));
    s.push_back(ratio(number_of(p, "inventory"), number_of(p, "capacity")));
    s.push_back(normalize(number_of(p, "basketSize"), 50.0));
    s.push_back(normalized_length(text_of(p, "description"), 512));
    append(s, keyword_flags(joined_text_of(p, {"intent", "productName", "description"}),
                            {"sale", "new", "bundle", "premium", "limited", "subscription"}));
    s.push_back(normalize(delta(price, list_price), 500.0));
    s.push_back(flag_of(p, "loyalCustomer"));
    append(s, formula_coefficients(text_of(p, "pricingFormula")));
    return s;
}

std::vector<float> travel_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(normalize(number_of(p, "distanceKm"), 20000.0));
    s.push_back(normalize(number_of(p, "durationHours"), 240.0));
    s.push_back(normalize(number_of(p, "budgetUsd"), 20000.0));
    s.push_back(ratio(number_of(p, "completedSteps"), number_of(p, "totalSteps")));
    s.push_back(normalized_count(collection_size_of(p, "layovers"), 6.0));
    append(s, keyword_flags(joined_text_of(p, {"notes", "destination", "intent"}),
                            {"flight", "hotel", "car", "visa", "delay", "emergency"}));
    s.push_back(flag_of(p, "international"));
    s.push_back(normalized_length(text_of(p, "destination"), 64));
    append(s, formula_coefficients(text_of(p, "routingFormula")));
    return s;
}

std::vector<float> health_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(normalize(number_of(p, "heartRate"), 200.0));
    s.push_back(normalize(number_of(p, "temperatureC"), 45.0));
    s.push_back(normalize(number_of(p, "oxygenSaturation"), 100.0));
    s.push_back(normalize(number_of(p, "severity"), 5.0));
    s.push_back(normalized_length(text_of(p, "symptoms"), 256));
    append(s, keyword_flags(joined_text_of(p, {"symptoms", "diagnosis"}),
                            {"pain", "fever", "cough", "injury", "allergy", "infection"}));
    s.push_back(flag_of(p, "isEmergency"));
    s.push_back(normalize(number_of(p, "medicationAdherence"), 100.0));
    s.push_back(normalized_count(collection_size_of(p, "allergies"), 10.0));
    append(s, formula_coefficients(text_of(p, "dosageFormula")));
    return s;
}

std::vector<float> finance_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(normalize(number_of(p, "amount"), 100000.0));
    s.push_back(normalize(number_of(p, "termMonths"), 360.0));
    s.push_back(normalize(number_of(p, "interestRate"), 30.0));
    s.push_back(normalize(number_of(p, "riskScore"), 100.0));
    s.push_back(ratio(number_of(p, "approvedAmount"), number_of(p, "requestedAmount")));
    s.push_back(flag_of(p, "requiresManualReview"));
    append(s, keyword_flags(joined_text_of(p, {"intent", "useCase"}),
                            {"loan", "investment", "budget", "savings", "fraud", "insurance"}));
    s.push_back(normalized_count(collection_size_of(p, "documents"), 20.0));
    append(s, formula_coefficients(text_of(p, "amortizationFormula")));
    return s;
}

std::vector<float> hospitality_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(ratio(number_of(p, "occupiedRooms"), number_of(p, "totalRooms")));
    s.push_back(normalize(number_of(p, "stayLength"), 30.0));
    s.push_back(normalize(number_of(p, "guestRating"), 5.0));
    s.push_back(normalized_count(collection_size_of(p, "amenities"), 25.0));
    append(s, keyword_flags(joined_text_of(p, {"preferences", "purpose"}),
                            {"business", "leisure", "family", "spa", "event", "conference"}));
    s.push_back(flag_of(p, "vipGuest"));
    s.push_back(ratio(number_of(p, "cleanRooms"), number_of(p, "totalRooms")));
    s.push_back(normalized_length(text_of(p, "roomType"), 64));
    append(s, formula_coefficients(text_of(p, "pricingModel")));
    return s;
}

std::vector<float> logistics_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(normalize(number_of(p, "weightKg"), 1000.0));
    s.push_back(normalize(number_of(p, "distanceKm"), 10000.0));
    s.push_back(normalize(number_of(p, "priority"), 10.0));
    s.push_back(ratio(number_of(p, "deliveredStops"), number_of(p, "totalStops")));
    s.push_back(normalized_count(collection_size_of(p, "stops"), 20.0));
    append(s, keyword_flags(joined_text_of(p, {"status", "notes"}),
                            {"delayed", "loaded", "customs", "handoff", "failed", "signed"}));
    s.push_back(flag_of(p, "hazardous"));
    s.push_back(normalized_length(text_of(p, "routeId"), 48));
    append(s, formula_coefficients(text_of(p, "routingFormula")));
    return s;
}

std::vector<float> manufacturing_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(normalize(number_of(p, "throughput"), 10000.0));
    s.push_back(normalize(number_of(p, "downtimeMinutes"), 1440.0));
    s.push_back(normalize(number_of(p, "defectRate"), 100.0));
    s.push_back(ratio(number_of(p, "completedUnits"), number_of(p, "plannedUnits")));
    s.push_back(normalized_length(text_of(p, "lineStatus"), 128));
    append(s, keyword_flags(joined_text_of(p, {"lineStatus", "alerts"}),
                            {"blocked", "maintenance", "overheat", "quality", "materials", "idle"}));
    s.push_back(flag_of(p, "maintenanceRequired"));
    s.push_back(normalize(number_of(p, "temperatureC"), 200.0));
    s.push_back(normalized_count(collection_size_of(p, "alerts"), 15.0));
    return s;
}

std::vector<float> agriculture_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(normalize(number_of(p, "soilMoisture"), 100.0));
    s.push_back(normalize(number_of(p, "rainfallMm"), 500.0));
    s.push_back(normalize(number_of(p, "growthStage"), 10.0));
    s.push_back(normalize(number_of(p, "temperatureC"), 50.0));
    s.push_back(ratio(number_of(p, "healthyPlants"), number_of(p, "totalPlants")));
    s.push_back(normalized_length(text_of(p, "crop"), 64));
    append(s, keyword_flags(joined_text_of(p, {"cropStatus", "issues"}),
                            {"pest", "drought", "disease", "harvest", "fertilizer", "yield"}));
    s.push_back(flag_of(p, "irrigationNeeded"));
    s.push_back(normalize(number_of(p, "soilPh"), 14.0));
    return s;
}

std::vector<float> energy_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(normalize(number_of(p, "consumptionMw"), 100000.0));
    s.push_back(normalize(number_of(p, "productionMw"), 100000.0));
    s.push_back(normalize(number_of(p, "renewableShare"), 1.0));
    s.push_back(ratio(number_of(p, "batteryLevel"), number_of(p, "batteryCapacity")));
    s.push_back(normalized_count(collection_size_of(p, "outages"), 20.0));
    append(s, keyword_flags(joined_text_of(p, {"gridStatus", "alerts"}),
                            {"peak", "shortage", "maintenance", "surplus", "derate", "fault"}));
    s.push_back(flag_of(p, "peakDemand"));
    s.push_back(normalized_length(text_of(p, "region"), 48));
    append(s, formula_coefficients(text_of(p, "loadForecastFormula")));
    return s;
}

std::vector<float> security_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(normalize(number_of(p, "alertLevel"), 10.0));
    s.push_back(normalize(number_of(p, "sensorsTriggered"), 50.0));
    s.push_back(ratio(number_of(p, "resolvedIncidents"), number_of(p, "openIncidents")));
    s.push_back(normalized_length(text_of(p, "location"), 128));
    append(s, keyword_flags(joined_text_of(p, {"summary", "alerts"}),
                            {"intrusion", "fire", "door", "window", "panic", "tamper"}));
    s.push_back(flag_of(p, "verified"));
    s.push_back(normalized_count(collection_size_of(p, "cameras"), 50.0));
    append(s, formula_coefficients(text_of(p, "thresholdFormula")));
    return s;
}

std::vector<float> entertainment_signals(const Payload& p) {
    std::vector<float> s;
    s.push_back(normalize(number_of(p, "durationMinutes"), 240.0));
    s.push_back(normalize(number_of(p, "rating"), 10.0));
    s.push_back(normalized_length(text_of(p, "title"), 96));
    append(s, keyword_flags(joined_text_of(p, {"genre", "mood", "query"}),
                            {"action", "comedy", "drama", "live", "kids", "sports"}));
    s.push_back(ratio(number_of(p, "ticketsSold"), number_of(p, "capacity")));
    s.push_back(flag_of(p, "isLive"));
    s.push_back(normalize(number_of(p, "audienceAge"), 100.0));
    s.push_back(normalized_length(text_of(p, "query"), 256));
    append(s, formula_coefficients(text_of(p, "scheduleFormula")));
    return s;
}

} // anonymous namespace

std::vector<std::shared_ptr<const IFeatureBuilder>> make_domain_builders() {
    return {
        std::make_shared<SignalFeatureBuilder>("education", &education_signals),
        std::make_shared<SignalFeatureBuilder>("retail", &retail_signals),
        std::make_shared<SignalFeatureBuilder>("travel", &travel_signals),
        std::make_shared<SignalFeatureBuilder>("health", &health_signals),
        std::make_shared<SignalFeatureBuilder>("finance", &finance_signals),
        std::make_shared<SignalFeatureBuilder>("hospitality", &hospitality_signals),
        std::make_shared<SignalFeatureBuilder>("logistics", &logistics_signals),
        std::make_shared<SignalFeatureBuilder>("manufacturing", &manufacturing_signals),
        std::make_shared<SignalFeatureBuilder>("agriculture", &agriculture_signals),
        std::make_shared<SignalFeatureBuilder>("energy", &energy_signals),
        std::make_shared<SignalFeatureBuilder>("security", &security_signals),
        std::make_shared<SignalFeatureBuilder>("entertainment", &entertainment_signals),
    };
}

} // namespace SkillRuntime::Features
