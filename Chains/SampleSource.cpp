#include "Chains/SampleSource.h"

// C++ includes
#include <algorithm>

// **************************************************
VectorSampleSource::VectorSampleSource(std::vector<Sample> steps, ChainMetadata metadata)
: Steps(std::move(steps)), Metadata(std::move(metadata)) {
// **************************************************
  Position = 0;
  NUMCMCLOG_DEBUG("Prepared in memory chain with {} steps", Steps.size());
}

// **************************************************
VectorSampleSource::~VectorSampleSource() {
// **************************************************

}

// **************************************************
size_t VectorSampleSource::NextBatch(SampleBatch& Batch, const size_t MaxRows) {
// **************************************************
  Batch.clear();
  if(MaxRows == 0) {
    NUMCMCLOG_ERROR("Asking for batch of zero size");
    throw NuMCMCException(__FILE__, __LINE__);
  }
  const size_t nRead = std::min(MaxRows, Steps.size() - Position);
  Batch.insert(Batch.end(), Steps.begin() + long(Position), Steps.begin() + long(Position + nRead));
  Position += nRead;
  return nRead;
}
