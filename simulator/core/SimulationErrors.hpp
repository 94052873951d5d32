#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

// A particle index that is not present in the store.
class IndexOutOfRange : public std::out_of_range {
public:
    IndexOutOfRange(std::size_t index, std::size_t particleCount)
        : std::out_of_range("Invalid particle index " + std::to_string(index) +
                            " (particle count is " + std::to_string(particleCount) + ")"),
          index(index), particleCount(particleCount)
    {}

    std::size_t index;
    std::size_t particleCount;
};

// A parameter rejected at construction or registration time.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
};

// Two particles at zero separation feeding a force that needs their direction.
// Raised by ParticlesSystem::advance, which then leaves the system untouched.
class DegenerateGeometry : public std::runtime_error {
public:
    explicit DegenerateGeometry(const std::string& what)
        : std::runtime_error(what), interactionIndex(0), indexA(0), indexB(0)
    {}

    DegenerateGeometry(std::size_t interactionIndex, std::size_t indexA, std::size_t indexB)
        : std::runtime_error("Zero separation between particles " + std::to_string(indexA) +
                             " and " + std::to_string(indexB) + " in interaction " +
                             std::to_string(interactionIndex)),
          interactionIndex(interactionIndex), indexA(indexA), indexB(indexB)
    {}

    std::size_t interactionIndex;
    std::size_t indexA;
    std::size_t indexB;
};
