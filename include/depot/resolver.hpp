#pragma once

#include <depot/result.hpp>
#include <depot/dependency.hpp>
#include <depot/log.hpp>
#include <depot/scanner.hpp>

#include <map>
#include <string>
#include <vector>

namespace depot {

// Resolved dependencies keyed by versionless key (group:artifact)
using CandidateMap = std::map<std::string, Dependency>;

struct ResolveOptions {
    bool use_latest = false;   // On conflict, take the newer version instead of failing
    int max_passes = 1000;     // Guard against non-convergence
};

// Computes one version per artifact across every declared dependency and
// their transitive closure.
//
// Each pass walks the current worklist. An entry either matches the current
// candidate for its artifact, becomes the candidate, narrows an open-ended
// range and re-queues everything declared for that artifact, or fails.
// Resolved candidates queue their POM dependencies for the next pass. The
// loop stops when a pass queues nothing.
class ResolutionEngine {
public:
    explicit ResolutionEngine(const RepositoryScanner& scanner,
                              log::Sink& sink = log::default_sink());

    Result<CandidateMap> resolve(const std::vector<Dependency>& declared,
                                 const ResolveOptions& options = {}) const;

private:
    const RepositoryScanner& scanner_;
    log::Sink& sink_;
};

} // namespace depot
