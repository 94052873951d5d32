#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "System.hpp"

// Field order in the written documents follows insertion order.
using json = nlohmann::ordered_json;

// Version written to, and required from, full-system documents.
constexpr int SYSTEM_SCHEMA_VERSION = 1;

json particleToJson(const Particle& p);
Particle particleFromJson(const json& j);

json forceKindToJson(const ForceKind& kind);
ForceKind forceKindFromJson(const json& j);

json externalForceKindToJson(const ExternalForceKind& kind);
ExternalForceKind externalForceKindFromJson(const json& j);

json geometryToJson(const GeometryKind& geometry);
GeometryKind geometryFromJson(const json& j);

json interactionToJson(const Interaction& interaction);
Interaction interactionFromJson(const json& j);

json constraintToJson(const Constraint& constraint);
Constraint constraintFromJson(const json& j);

json snapshotToJson(const Snapshot& snapshot);

// Full system: schemaVersion, time, snapshotsSaved, particles, interactions,
// constraints. Doubles are written in shortest round-trip form, so a restored
// system continues bit-identically.
json systemToJson(const ParticlesSystem& sys);
ParticlesSystem systemFromJson(const json& j);

void saveSystem(const ParticlesSystem& sys, const std::string& path);
ParticlesSystem loadSystem(const std::string& path);
