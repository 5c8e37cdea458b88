#pragma once

#include "codec/CodecResult.hpp"
#include "codec/CompressionCodec.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ops
{

enum class OperationCategory
{
    Codec,     // encode/decode and re-encoding
    Metrics,   // counts and frequency analysis
    Transform  // case styles, filters, escaping, rearrangement
};

// Every operation maps one text value to one text value; counts are rendered in decimal.
using OperationHandler = std::function<codec::TextResult(const std::string&)>;

struct OperationDefinition
{
    std::string name;          // e.g. "to-hex", "count-words"
    OperationCategory category = OperationCategory::Codec;
    std::string summary;
    OperationHandler handler;
};

struct RegistryOptions
{
    codec::CompressionOptions compression;
    std::optional<std::uint32_t> shuffle_seed; // std::random_device when unset
};

// Flat, name-addressed table of every operation the library exposes.
// The shuffle operation draws from a generator owned by the registry, so a registry
// instance must not be shared between threads.
class OperationRegistry
{
public:
    explicit OperationRegistry(RegistryOptions options = {});

    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    // nullptr when no operation has that name
    const OperationDefinition* findOperation(const std::string& name) const;

    // nullopt when no operation has that name
    std::optional<codec::TextResult> run(const std::string& name, const std::string& input) const;

    // Definitions in registration order
    const std::vector<OperationDefinition>& operations() const { return definitions_; }

    static const char* CategoryToString(OperationCategory category);

private:
    void registerOperation(std::string name, OperationCategory category, std::string summary,
                           OperationHandler handler);
    void initializeCodecOperations();
    void initializeMetricOperations();
    void initializeTransformOperations();

    RegistryOptions options_;
    mutable std::mt19937 rng_;
    std::vector<OperationDefinition> definitions_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace ops
