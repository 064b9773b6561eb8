// =================================================================
// src/Feedlens/BatchPlanner.cpp
// =================================================================

#include "Feedlens/BatchPlanner.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace Feedlens {

BatchPlanner::BatchPlanner(const BatchPlannerConfig& config) : m_config(config) {}

std::vector<Batch> BatchPlanner::plan(const std::vector<std::string>& inputs, BatchMode mode) const {
    std::vector<size_t> indices(inputs.size());
    std::iota(indices.begin(), indices.end(), 0);
    return plan(inputs, indices, mode);
}

std::vector<Batch> BatchPlanner::plan(const std::vector<std::string>& inputs,
                                      const std::vector<size_t>& indices,
                                      BatchMode mode) const {
    if (inputs.size() != indices.size()) {
        throw std::invalid_argument("BatchPlanner: inputs and indices differ in length");
    }
    
    std::vector<Batch> batches;
    if (inputs.empty()) {
        return batches;
    }
    
    size_t batch_size = selectBatchSize(averageLength(inputs), mode);
    batches.reserve((inputs.size() + batch_size - 1) / batch_size);
    
    for (size_t start = 0; start < inputs.size(); start += batch_size) {
        size_t end = std::min(start + batch_size, inputs.size());
        
        Batch batch;
        batch.batch_index = batches.size();
        batch.texts.assign(inputs.begin() + start, inputs.begin() + end);
        batch.original_indices.assign(indices.begin() + start, indices.begin() + end);
        batches.push_back(std::move(batch));
    }
    
    return batches;
}

size_t BatchPlanner::selectBatchSize(double average_length, BatchMode mode) const {
    const auto& sizes = (mode == BatchMode::REMOTE) ? m_config.remote_batch_sizes
                                                    : m_config.local_batch_sizes;
    
    size_t bucket = m_config.length_thresholds.size();
    for (size_t i = 0; i < m_config.length_thresholds.size(); ++i) {
        if (average_length < static_cast<double>(m_config.length_thresholds[i])) {
            bucket = i;
            break;
        }
    }
    
    return std::max<size_t>(1, sizes[bucket]);
}

double BatchPlanner::averageLength(const std::vector<std::string>& inputs) {
    if (inputs.empty()) {
        return 0.0;
    }
    
    size_t total = 0;
    for (const auto& text : inputs) {
        total += text.size();
    }
    return static_cast<double>(total) / inputs.size();
}

} // namespace Feedlens
