#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <cmath>

namespace ox {

VectorIndex::VectorIndex() = default;

VectorIndex::~VectorIndex() = default;

bool VectorIndex::create(int dimensions, int initialCapacity)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (dimensions <= 0) {
        LOG_ERROR(oxIndex, "VectorIndex::create requires a positive dimension, got %d", dimensions);
        return false;
    }

    m_index.reset();
    m_space.reset();
    m_dimensions = dimensions;
    m_deletedCount = 0;

    try {
        const int capacity = std::max(initialCapacity, 1);
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(dimensions));
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(oxIndex, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        m_dimensions = 0;
        return false;
    }
}

void VectorIndex::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index.reset();
    m_space.reset();
    m_dimensions = 0;
    m_deletedCount = 0;
}

bool VectorIndex::addVector(const float* embedding, uint64_t label)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_index || embedding == nullptr) {
        LOG_WARN(oxIndex, "VectorIndex::addVector called with unavailable index or null embedding");
        return false;
    }
    if (!ensureCapacityForOneMore()) {
        return false;
    }

    // A rolled-back transaction can hand out a row id whose label is still
    // present as a deleted element; addPoint revives it in place.
    bool revivesDeleted = false;
    const auto existing = m_index->label_lookup_.find(static_cast<hnswlib::labeltype>(label));
    if (existing != m_index->label_lookup_.end()) {
        revivesDeleted = m_index->isMarkedDeleted(existing->second);
    }

    try {
        m_index->addPoint(embedding, static_cast<hnswlib::labeltype>(label));
        if (revivesDeleted) {
            m_deletedCount = std::max(0, m_deletedCount - 1);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(oxIndex, "VectorIndex::addVector(%llu) failed: %s",
                  static_cast<unsigned long long>(label), e.what());
        return false;
    }
}

bool VectorIndex::deleteVector(uint64_t label)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_index) {
        return false;
    }
    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        ++m_deletedCount;
        return true;
    } catch (const std::exception& e) {
        // Unknown or already deleted label.
        LOG_WARN(oxIndex, "VectorIndex::deleteVector(%llu) failed: %s",
                 static_cast<unsigned long long>(label), e.what());
        return false;
    }
}

bool VectorIndex::restoreVector(uint64_t label)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_index) {
        return false;
    }
    try {
        m_index->unmarkDelete(static_cast<hnswlib::labeltype>(label));
        m_deletedCount = std::max(0, m_deletedCount - 1);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN(oxIndex, "VectorIndex::restoreVector(%llu) failed: %s",
                 static_cast<unsigned long long>(label), e.what());
        return false;
    }
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(const float* queryVector, int k) const
{
    std::vector<KnnResult> results;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index || queryVector == nullptr || k <= 0) {
        return results;
    }

    const int live = static_cast<int>(m_index->getCurrentElementCount()) - m_deletedCount;
    if (live <= 0) {
        return results;
    }

    try {
        auto queue = m_index->searchKnn(queryVector, static_cast<size_t>(std::min(k, live)));
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<uint64_t>(entry.second), entry.first});
        }
        std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
            return a.distance < b.distance;
        });
        return results;
    } catch (const std::exception& e) {
        LOG_ERROR(oxIndex, "VectorIndex::search failed: %s", e.what());
        return {};
    }
}

int VectorIndex::totalElements() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getCurrentElementCount());
}

int VectorIndex::deletedElements() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_deletedCount;
}

bool VectorIndex::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index != nullptr;
}

int VectorIndex::dimensions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dimensions;
}

bool VectorIndex::normalize(std::vector<float>& embedding)
{
    double sumSquares = 0.0;
    for (float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }
    if (sumSquares <= 0.0 || !std::isfinite(sumSquares)) {
        return false;
    }
    const double norm = std::sqrt(sumSquares);
    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return true;
}

double VectorIndex::scoreFromDistance(float distance)
{
    const double score = 1.0 - static_cast<double>(distance) / 2.0;
    return std::clamp(score, 0.0, 1.0);
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        LOG_ERROR(oxIndex, "VectorIndex has zero max elements");
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    try {
        m_index->resizeIndex(newCapacity);
        LOG_DEBUG(oxIndex, "VectorIndex resized to capacity %zu", newCapacity);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(oxIndex, "VectorIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace ox
