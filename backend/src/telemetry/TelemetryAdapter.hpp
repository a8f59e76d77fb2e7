#pragma once
#include <string>
#include <vector>
#include "TelemetrySource.hpp"
#include "../core/NodeIdNormalizer.hpp"
#include "../core/ReviewState.hpp"

/*
  Turns raw card records into review states grouped by canonical node id.
  Linkage parsing and id normalization happen here and nowhere else.
*/
class TelemetryAdapter {
public:
    TelemetryAdapter(TelemetrySource& source, const NodeIdNormalizer& normalizer,
        const std::string& filter = "_KG_Map:*");

    // Queries the source once. TelemetryError propagates.
    ReviewStateMap fetchReviewStates();

    ReviewStateMap group(const std::vector<RawReviewRecord>& records) const;

private:
    TelemetrySource& source;
    const NodeIdNormalizer& normalizer;
    std::string filter;
};
