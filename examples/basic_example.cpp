// File: examples/basic_example.cpp
//
// Basic P3IF framework example.
// Demonstrates:
// - Creating a Framework and adding properties, processes and perspectives
// - Connecting them with relationships
// - Validating and reading cached metrics
// - Hot-swapping a process across existing relationships
// - Multiplexing an external framework and exporting to JSON

#include "core/errors.hpp"
#include "framework/framework.hpp"
#include "io/json_codec.hpp"
#include <iostream>
#include <iomanip>
#include <vector>

using namespace p3if;

int main() {
    std::cout << "=== P3IF Basic Framework Example ===\n\n";

    // Step 1: Configure and create the Framework
    std::cout << "Step 1: Creating Framework...\n";

    Framework::Config config;
    config.metrics_cache_timeout = std::chrono::seconds(60);
    config.removal_policy = RemovalPolicy::RESTRICT;

    Framework framework(config);
    std::cout << "  ✓ Framework initialized\n\n";

    // Step 2: Add patterns in every dimension
    std::cout << "Step 2: Adding patterns...\n";

    Pattern encryption = Pattern::Create(PatternType::PROPERTY, "Encryption at rest", "security",
                                         std::string("Stored data is unreadable without keys"));
    encryption.AddTag("compliance");
    Pattern rotation = Pattern::Create(PatternType::PROCESS, "Key rotation", "ops");
    Pattern auditor = Pattern::Create(PatternType::PERSPECTIVE, "External auditor", "compliance");

    for (const Pattern* pattern : {&encryption, &rotation, &auditor}) {
        framework.AddPattern(*pattern);
        std::cout << "  Added " << ToString(pattern->GetType()) << ": " << pattern->GetName() << "\n";
    }
    std::cout << "\n";

    // Step 3: Connect them
    std::cout << "Step 3: Creating relationships...\n";

    std::string relationship_id = framework.AddRelationship(
        Relationship::Connect(encryption.GetId(), rotation.GetId(), auditor.GetId(), 0.8, 0.9));
    std::cout << "  ✓ Relationship " << relationship_id << "\n\n";

    // Step 4: Validate and measure
    std::cout << "Step 4: Validation and metrics...\n";

    ValidationReport report = framework.ValidateFramework();
    std::cout << "  " << FormatReport(report);

    Metrics metrics = framework.GetMetrics();
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Patterns: " << metrics.total_patterns
              << ", relationships: " << metrics.total_relationships
              << ", average strength: " << metrics.average_relationship_strength << "\n\n";

    // Step 5: Hot-swap the process
    std::cout << "Step 5: Hot-swapping the process...\n";

    Pattern automated = Pattern::Create(PatternType::PROCESS, "Automated key rotation", "ops");
    framework.AddPattern(automated);
    size_t updated = framework.HotSwapDimension(rotation, automated);
    std::cout << "  ✓ " << updated << " relationship(s) now use " << automated.GetName() << "\n";

    try {
        framework.RemovePattern(automated.GetId());
    } catch (const FrameworkError& e) {
        std::cout << "  Removal blocked: " << e.what() << "\n";
    }
    std::cout << "\n";

    // Step 6: Multiplex an external framework
    std::cout << "Step 6: Multiplexing an external framework...\n";

    ExternalFramework external = json_codec::DecodeExternalFramework(json_codec::Parse(R"({
        "properties": [{"id": "ext-1", "name": "Tamper evidence", "domain": "security"}],
        "perspectives": [{"id": "ext-2", "name": "Incident responder"}],
        "relationships": [{"property_id": "ext-1", "perspective_id": "ext-2", "strength": 0.6}]
    })"));
    MultiplexResult merged = framework.Multiplex(external);
    std::cout << "  " << merged.ToString() << "\n\n";

    // Step 7: Export
    std::cout << "Step 7: Exporting...\n";

    std::string json = framework.ExportToJson();
    std::cout << "  Exported " << framework.PatternCount() << " patterns, "
              << framework.RelationshipCount() << " relationships ("
              << json.size() << " bytes of JSON)\n\n";

    std::cout << framework.GetMetrics().ToString();
    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
