#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace ox {

// In-memory HNSW index over L2-normalized vectors. Labels are supplied by the
// caller (chunk row ids), so the index can be rebuilt from the database at any
// time and never needs to be persisted on its own.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;   // 1 - cosine similarity
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    VectorIndex();
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    // Drops any existing content and creates an empty index.
    bool create(int dimensions, int initialCapacity = kInitialCapacity);
    void reset();

    // Callers pass normalized vectors of exactly dimensions() floats.
    bool addVector(const float* embedding, uint64_t label);
    bool deleteVector(uint64_t label);
    bool restoreVector(uint64_t label);

    std::vector<KnnResult> search(const float* queryVector, int k) const;

    int totalElements() const;
    int deletedElements() const;
    int liveElements() const { return totalElements() - deletedElements(); }
    bool isAvailable() const;
    int dimensions() const;

    // Scales `embedding` to unit length in place; returns false for a zero vector.
    static bool normalize(std::vector<float>& embedding);

    // Maps an inner-product distance onto a 0..1 similarity score.
    static double scoreFromDistance(float distance);

private:
    bool ensureCapacityForOneMore();

    int m_dimensions = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    int m_deletedCount = 0;
    mutable std::mutex m_mutex;
};

} // namespace ox
