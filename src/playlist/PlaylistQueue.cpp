// Repository: OnAir-relay
// Component: Playlist Queue
// Copyright (c) 2026 OnAir

#include "onair/playlist/PlaylistQueue.hpp"

#include <algorithm>

namespace onair::playlist {

namespace {

std::string BaseName(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

}  // namespace

const char* PlaylistErrorToString(PlaylistError e) {
  switch (e) {
    case PlaylistError::kNone:
      return "NONE";
    case PlaylistError::kEmptyQueue:
      return "EMPTY_QUEUE";
    case PlaylistError::kItemNotFound:
      return "ITEM_NOT_FOUND";
    case PlaylistError::kItemPlayed:
      return "ITEM_PLAYED";
  }
  return "UNKNOWN";
}

PlaylistItem PlaylistQueue::Add(const std::string& path, const std::string& title) {
  std::lock_guard<std::mutex> lock(mutex_);
  PlaylistItem item;
  item.item_id = next_item_id_++;
  item.position = next_position_++;
  item.path = path;
  item.title = title.empty() ? BaseName(path) : title;
  items_.push_back(item);
  return item;
}

PlaylistError PlaylistQueue::Remove(int64_t item_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(items_.begin(), items_.end(),
                         [item_id](const PlaylistItem& i) { return i.item_id == item_id; });
  if (it == items_.end()) return PlaylistError::kItemNotFound;
  if (it->played) return PlaylistError::kItemPlayed;
  items_.erase(it);
  return PlaylistError::kNone;
}

size_t PlaylistQueue::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t before = items_.size();
  items_.erase(std::remove_if(items_.begin(), items_.end(),
                              [](const PlaylistItem& i) { return !i.played; }),
               items_.end());
  return before - items_.size();
}

std::vector<PlaylistItem> PlaylistQueue::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_;
}

PlaylistQueue::ItemResult PlaylistQueue::Advance() const {
  std::lock_guard<std::mutex> lock(mutex_);
  // items_ is kept in position order: Add only appends.
  for (const auto& item : items_) {
    if (!item.played) return ItemResult::Success(item);
  }
  return ItemResult::Failure(PlaylistError::kEmptyQueue);
}

PlaylistError PlaylistQueue::MarkPlayed(int64_t item_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& item : items_) {
    if (item.item_id == item_id) {
      item.played = true;
      return PlaylistError::kNone;
    }
  }
  return PlaylistError::kItemNotFound;
}

std::vector<std::string> PlaylistQueue::UnplayedPaths() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto& item : items_) {
    if (!item.played) out.push_back(item.path);
  }
  return out;
}

size_t PlaylistQueue::UnplayedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
                                           [](const PlaylistItem& i) { return !i.played; }));
}

}  // namespace onair::playlist
