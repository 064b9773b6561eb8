// =================================================================
// include/Feedlens/BatchPlanner.hpp
// =================================================================
// Length-adaptive partitioning of inputs into batches.

#pragma once

#include <array>
#include <string>
#include <vector>

namespace Feedlens {

/**
 * @brief Destination of a batch; local work tolerates larger batches
 */
enum class BatchMode {
    REMOTE,
    LOCAL
};

/**
 * @brief Batch planner configuration
 *
 * Bucket i applies while the average input length is below
 * length_thresholds[i]; the last bucket covers everything longer.
 */
struct BatchPlannerConfig {
    std::array<size_t, 3> length_thresholds{{100, 200, 500}};
    std::array<size_t, 4> remote_batch_sizes{{20, 15, 10, 5}};
    std::array<size_t, 4> local_batch_sizes{{100, 50, 25, 10}};
};

/**
 * @brief Contiguous group of inputs processed together
 */
struct Batch {
    std::vector<std::string> texts;
    std::vector<size_t> original_indices;   ///< Output position of each text
    size_t batch_index = 0;

    size_t size() const { return texts.size(); }
};

/**
 * @brief Stateless planner choosing batch size from average input length
 */
class BatchPlanner {
public:
    explicit BatchPlanner(const BatchPlannerConfig& config = BatchPlannerConfig());

    /**
     * @brief Partition inputs into batches whose indices are input positions
     */
    std::vector<Batch> plan(const std::vector<std::string>& inputs, BatchMode mode) const;

    /**
     * @brief Partition inputs into batches carrying caller-supplied indices
     * @param inputs Texts to batch
     * @param indices Output position of each text (same length as inputs)
     * @param mode Remote or local sizing
     */
    std::vector<Batch> plan(const std::vector<std::string>& inputs,
                            const std::vector<size_t>& indices,
                            BatchMode mode) const;

    /**
     * @brief Batch size selected for a given average length
     */
    size_t selectBatchSize(double average_length, BatchMode mode) const;

    static double averageLength(const std::vector<std::string>& inputs);

private:
    BatchPlannerConfig m_config;
};

} // namespace Feedlens
