#include "SystemSerializer.hpp"
#include "Overloaded.hpp"
#include <fstream>
#include <stdexcept>

namespace
{
    template <class Unit>
    json vectorToJson(const Vector3<Unit>& v)
    {
        return json{{"x", v.x}, {"y", v.y}, {"z", v.z}};
    }

    template <class Unit>
    Vector3<Unit> vectorFromJson(const json& j)
    {
        return Vector3<Unit>(j.at("x").get<double>(), j.at("y").get<double>(), j.at("z").get<double>());
    }

    std::string kindOf(const json& j, const char* what)
    {
        if (!j.is_object() || !j.contains("kind")) {
            throw std::runtime_error(std::string("Missing \"kind\" in ") + what + ": " + j.dump());
        }
        return j.at("kind").get<std::string>();
    }

    std::string typeOf(const json& j, const char* what)
    {
        if (!j.is_object() || !j.contains("type")) {
            throw std::runtime_error(std::string("Missing \"type\" in ") + what + ": " + j.dump());
        }
        return j.at("type").get<std::string>();
    }
}

json particleToJson(const Particle& p)
{
    return json{
        {"position", vectorToJson(p.position)},
        {"velocity", vectorToJson(p.velocity)},
        {"mass", p.mass},
    };
}

Particle particleFromJson(const json& j)
{
    Particle p;
    p.position = vectorFromJson<units::Position>(j.at("position"));
    p.velocity = vectorFromJson<units::Velocity>(j.at("velocity"));
    p.mass = j.at("mass").get<double>();
    return p;
}

json forceKindToJson(const ForceKind& kind)
{
    return std::visit(Overloaded{
        [](const Elastic& f) {
            return json{{"kind", "elastic"}, {"k", f.k}, {"d0", f.d0}};
        },
        [](const Damping& f) {
            return json{{"kind", "damping"}, {"c", f.c}};
        },
        [](const Gravitational& f) {
            return json{{"kind", "gravitational"}, {"G", f.gravitationalConstant}};
        },
        [](const Sticky& f) {
            return json{{"kind", "sticky"}, {"dWell", f.dWell}, {"dMax", f.dMax},
                        {"fSticky", f.fSticky}, {"fRepulsive", f.fRepulsive}};
        },
    }, kind);
}

ForceKind forceKindFromJson(const json& j)
{
    const std::string kind = kindOf(j, "force");
    if (kind == "elastic") {
        return Elastic{j.at("k").get<double>(), j.at("d0").get<double>()};
    } else if (kind == "damping") {
        return Damping{j.at("c").get<double>()};
    } else if (kind == "gravitational") {
        return Gravitational{j.at("G").get<double>()};
    } else if (kind == "sticky") {
        return Sticky{j.at("dWell").get<double>(), j.at("dMax").get<double>(),
                      j.at("fSticky").get<double>(), j.at("fRepulsive").get<double>()};
    }
    throw std::runtime_error("Unknown force kind: " + kind);
}

json externalForceKindToJson(const ExternalForceKind& kind)
{
    return std::visit(Overloaded{
        [](const LinearDrag& f) {
            return json{{"kind", "linearDrag"}, {"coefficient", f.coefficient}};
        },
        [](const UniformGravitational& f) {
            return json{{"kind", "uniformGravitational"}, {"acceleration", vectorToJson(f.acceleration)}};
        },
    }, kind);
}

ExternalForceKind externalForceKindFromJson(const json& j)
{
    const std::string kind = kindOf(j, "external force");
    if (kind == "linearDrag") {
        return LinearDrag{j.at("coefficient").get<double>()};
    } else if (kind == "uniformGravitational") {
        return UniformGravitational{vectorFromJson<units::Acceleration>(j.at("acceleration"))};
    }
    throw std::runtime_error("Unknown external force kind: " + kind);
}

json geometryToJson(const GeometryKind& geometry)
{
    return std::visit(Overloaded{
        [](const Plane& plane) {
            return json{{"kind", "plane"},
                        {"position", vectorToJson(plane.getPosition())},
                        {"normal", vectorToJson(plane.getNormal())}};
        },
        [](const Sphere& sphere) {
            return json{{"kind", "sphere"},
                        {"center", vectorToJson(sphere.getCenter())},
                        {"radius", sphere.getRadius()}};
        },
    }, geometry);
}

GeometryKind geometryFromJson(const json& j)
{
    const std::string kind = kindOf(j, "geometry");
    if (kind == "plane") {
        return Plane(vectorFromJson<units::Position>(j.at("position")),
                     vectorFromJson<units::Position>(j.at("normal")));
    } else if (kind == "sphere") {
        return Sphere(vectorFromJson<units::Position>(j.at("center")),
                      j.at("radius").get<double>());
    }
    throw std::runtime_error("Unknown geometry kind: " + kind);
}

json interactionToJson(const Interaction& interaction)
{
    return std::visit(Overloaded{
        [](const PairwiseForce& pair) {
            return json{{"type", "pairwise"}, {"a", pair.indexA}, {"b", pair.indexB},
                        {"force", forceKindToJson(pair.kind)}};
        },
        [](const ExternalForce& ext) {
            return json{{"type", "external"}, {"particle", ext.index},
                        {"force", externalForceKindToJson(ext.kind)}};
        },
    }, interaction);
}

Interaction interactionFromJson(const json& j)
{
    const std::string type = typeOf(j, "interaction");
    if (type == "pairwise") {
        return PairwiseForce{j.at("a").get<std::size_t>(), j.at("b").get<std::size_t>(),
                             forceKindFromJson(j.at("force"))};
    } else if (type == "external") {
        return ExternalForce{j.at("particle").get<std::size_t>(),
                             externalForceKindFromJson(j.at("force"))};
    }
    throw std::runtime_error("Unknown interaction type: " + type);
}

json constraintToJson(const Constraint& constraint)
{
    return std::visit(Overloaded{
        [](const ExternalConstraint& ext) {
            return json{{"type", "external"}, {"particle", ext.index},
                        {"geometry", geometryToJson(ext.geometry)}};
        },
    }, constraint);
}

Constraint constraintFromJson(const json& j)
{
    const std::string type = typeOf(j, "constraint");
    if (type == "external") {
        return ExternalConstraint{j.at("particle").get<std::size_t>(),
                                  geometryFromJson(j.at("geometry"))};
    }
    throw std::runtime_error("Unknown constraint type: " + type);
}

json snapshotToJson(const Snapshot& snapshot)
{
    json particles = json::array();
    for (const auto& p : snapshot.particles) {
        particles.push_back(json{
            {"index", p.index},
            {"position", vectorToJson(p.position)},
            {"velocity", vectorToJson(p.velocity)},
            {"mass", p.mass},
        });
    }
    return json{
        {"sequenceIndex", snapshot.sequenceIndex},
        {"time", snapshot.time},
        {"particles", particles},
    };
}

json systemToJson(const ParticlesSystem& sys)
{
    json particles = json::array();
    for (const auto& p : sys.getParticles()) particles.push_back(particleToJson(p));

    json interactions = json::array();
    for (const auto& i : sys.getInteractions()) interactions.push_back(interactionToJson(i));

    json constraints = json::array();
    for (const auto& c : sys.getConstraints()) constraints.push_back(constraintToJson(c));

    return json{
        {"schemaVersion", SYSTEM_SCHEMA_VERSION},
        {"time", sys.getSimulationTime()},
        {"snapshotsSaved", sys.getSnapshotsSaved()},
        {"particles", particles},
        {"interactions", interactions},
        {"constraints", constraints},
    };
}

ParticlesSystem systemFromJson(const json& j)
{
    const int version = j.at("schemaVersion").get<int>();
    if (version != SYSTEM_SCHEMA_VERSION) {
        throw std::runtime_error("Unsupported schema version: " + std::to_string(version));
    }

    std::vector<Particle> particles;
    for (const auto& p : j.at("particles")) particles.push_back(particleFromJson(p));

    std::vector<Interaction> interactions;
    for (const auto& i : j.at("interactions")) interactions.push_back(interactionFromJson(i));

    std::vector<Constraint> constraints;
    for (const auto& c : j.at("constraints")) constraints.push_back(constraintFromJson(c));

    return ParticlesSystem::fromState(particles, interactions, constraints,
                                      j.at("time").get<double>(),
                                      j.at("snapshotsSaved").get<std::uint64_t>());
}

void saveSystem(const ParticlesSystem& sys, const std::string& path)
{
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open system file for writing: " + path);
    }
    out << systemToJson(sys).dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("Failed writing system file: " + path);
    }
}

ParticlesSystem loadSystem(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open system file: " + path);
    }

    json j;
    in >> j;
    return systemFromJson(j);
}
