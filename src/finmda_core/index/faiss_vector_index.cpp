#include "finmda_core/index/faiss_vector_index.hpp"

#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <mutex>

#include "finmda_core/errors.hpp"

namespace finmda_core {

namespace {

faiss::IndexIDMap2 *create_base_index(size_t dimension) {
  auto base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension));
  auto id_map = new faiss::IndexIDMap2(base_index);
  // The id map deletes the flat index with itself
  id_map->own_fields = true;
  return id_map;
}

bool by_distance_then_id(const IndexMatch &a, const IndexMatch &b) {
  if (a.distance != b.distance)
    return a.distance < b.distance;
  return a.id < b.id;
}

}  // namespace

FaissVectorIndex::FaissVectorIndex(size_t dimension)
    : dimension_(dimension), faiss_index_(nullptr) {
  if (dimension == 0) {
    throw InvalidConfig("Vector index dimension must be greater than 0");
  }
  faiss_index_.reset(create_base_index(dimension_));
}

FaissVectorIndex::~FaissVectorIndex() = default;

void FaissVectorIndex::validate_vector_dimension(const std::vector<float> &vector) const {
  if (vector.size() != dimension_) {
    throw InvalidConfig("Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                        ", got " + std::to_string(vector.size()));
  }
}

void FaissVectorIndex::upsert(const std::vector<IndexItem> &items) {
  for (const auto &item : items) {
    validate_vector_dimension(item.vector);
  }
  std::unique_lock lock(mutex_);
  upsert_locked(items);
}

size_t FaissVectorIndex::remove(const MetadataFilter &filter) {
  std::unique_lock lock(mutex_);
  return remove_locked(ids_matching_locked(filter));
}

size_t FaissVectorIndex::replace(const MetadataFilter &filter,
                                 const std::vector<IndexItem> &items) {
  for (const auto &item : items) {
    validate_vector_dimension(item.vector);
  }
  std::unique_lock lock(mutex_);
  size_t removed = remove_locked(ids_matching_locked(filter));
  upsert_locked(items);
  return removed;
}

void FaissVectorIndex::upsert_locked(const std::vector<IndexItem> &items) {
  if (items.empty())
    return;

  // Later duplicates in the same batch win, like sequential upserts would.
  std::unordered_map<std::string, size_t> last_position;
  for (size_t i = 0; i < items.size(); ++i) {
    last_position[items[i].id] = i;
  }

  std::vector<std::string> replaced_ids;
  for (const auto &[id, position] : last_position) {
    if (records_.count(id)) {
      replaced_ids.push_back(id);
    }
  }
  remove_locked(replaced_ids);

  std::vector<float> flat;
  std::vector<faiss::idx_t> labels;
  flat.reserve(last_position.size() * dimension_);
  labels.reserve(last_position.size());

  for (size_t i = 0; i < items.size(); ++i) {
    const IndexItem &item = items[i];
    if (last_position[item.id] != i)
      continue;

    faiss::idx_t label = next_label_++;
    flat.insert(flat.end(), item.vector.begin(), item.vector.end());
    labels.push_back(label);
    records_[item.id] = Record{label, item.text, item.metadata};
    label_to_id_[label] = item.id;
  }

  const auto n = static_cast<faiss::idx_t>(labels.size());
  faiss::fvec_renorm_L2(dimension_, static_cast<size_t>(n), flat.data());
  faiss_index_->add_with_ids(n, flat.data(), labels.data());
}

size_t FaissVectorIndex::remove_locked(const std::vector<std::string> &ids) {
  if (ids.empty())
    return 0;

  std::vector<faiss::idx_t> labels;
  labels.reserve(ids.size());
  for (const auto &id : ids) {
    auto it = records_.find(id);
    if (it == records_.end())
      continue;
    labels.push_back(it->second.label);
    label_to_id_.erase(it->second.label);
    records_.erase(it);
  }
  if (labels.empty())
    return 0;

  faiss::IDSelectorBatch selector(labels.size(), labels.data());
  faiss_index_->remove_ids(selector);
  return labels.size();
}

std::vector<std::string> FaissVectorIndex::ids_matching(const MetadataFilter &filter) const {
  std::shared_lock lock(mutex_);
  return ids_matching_locked(filter);
}

std::vector<std::string> FaissVectorIndex::ids_matching_locked(
    const MetadataFilter &filter) const {
  std::vector<std::string> ids;
  for (const auto &[id, record] : records_) {
    if (filter.matches(record.metadata)) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<IndexMatch> FaissVectorIndex::query(const std::vector<float> &vector,
                                                size_t top_k,
                                                const std::optional<MetadataFilter> &filter) {
  validate_vector_dimension(vector);
  if (top_k == 0) {
    return {};
  }

  std::shared_lock lock(mutex_);
  const faiss::idx_t total = faiss_index_->ntotal;
  if (total == 0) {
    return {};
  }

  // The whole index is ranked so that ties at the top_k boundary resolve by id
  // and filtered queries still find top_k matches.
  const bool filtered = filter.has_value() && !filter->empty();
  const faiss::idx_t k = total;

  std::vector<float> query_vector(vector);
  faiss::fvec_renorm_L2(dimension_, 1, query_vector.data());

  std::vector<float> similarities(k);
  std::vector<faiss::idx_t> labels(k);
  faiss_index_->search(1, query_vector.data(), k, similarities.data(), labels.data());

  std::vector<IndexMatch> matches;
  matches.reserve(k);
  for (faiss::idx_t i = 0; i < k; ++i) {
    if (labels[i] == -1)
      continue;
    auto id_it = label_to_id_.find(labels[i]);
    if (id_it == label_to_id_.end())
      continue;
    const Record &record = records_.at(id_it->second);
    if (filtered && !filter->matches(record.metadata))
      continue;

    IndexMatch match;
    match.id = id_it->second;
    match.text = record.text;
    match.metadata = record.metadata;
    match.distance = std::clamp(1.0f - similarities[i], 0.0f, 2.0f);
    matches.push_back(std::move(match));
  }

  std::sort(matches.begin(), matches.end(), by_distance_then_id);
  if (matches.size() > top_k) {
    matches.resize(top_k);
  }
  return matches;
}

size_t FaissVectorIndex::count(const std::optional<MetadataFilter> &filter) {
  std::shared_lock lock(mutex_);
  if (!filter.has_value() || filter->empty()) {
    return records_.size();
  }
  return ids_matching_locked(*filter).size();
}

void FaissVectorIndex::clear() {
  reset({});
}

void FaissVectorIndex::reset(const std::vector<IndexItem> &items) {
  for (const auto &item : items) {
    validate_vector_dimension(item.vector);
  }
  std::unique_lock lock(mutex_);
  faiss_index_.reset(create_base_index(dimension_));
  records_.clear();
  label_to_id_.clear();
  next_label_ = 0;
  upsert_locked(items);
}

}  // namespace finmda_core
