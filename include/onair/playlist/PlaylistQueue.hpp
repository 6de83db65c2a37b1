// Repository: OnAir-relay
// Component: Playlist Queue
// Purpose: Ordered playlist items with a played marker, shared between the
//          operator surface and the session that broadcasts them.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_PLAYLIST_PLAYLIST_QUEUE_HPP_
#define ONAIR_PLAYLIST_PLAYLIST_QUEUE_HPP_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace onair::playlist {

struct PlaylistItem {
  int64_t item_id = 0;
  int32_t position = 0;  // 1-based, assigned on Add, never reused
  std::string path;
  std::string title;
  bool played = false;
};

enum class PlaylistError {
  kNone,
  kEmptyQueue,    // No unplayed item remains
  kItemNotFound,  // Unknown item id
  kItemPlayed,    // Played items are history and cannot be removed
};

const char* PlaylistErrorToString(PlaylistError e);

// Thread-safe. Items are immutable once added except for `played`.
class PlaylistQueue {
 public:
  PlaylistQueue() = default;

  PlaylistQueue(const PlaylistQueue&) = delete;
  PlaylistQueue& operator=(const PlaylistQueue&) = delete;

  struct ItemResult {
    bool success;
    PlaylistError error;
    PlaylistItem item;

    static ItemResult Success(PlaylistItem i) {
      return {true, PlaylistError::kNone, std::move(i)};
    }
    static ItemResult Failure(PlaylistError e) {
      return {false, e, PlaylistItem{}};
    }
  };

  // Appends at the next position. Title defaults to the file name.
  PlaylistItem Add(const std::string& path, const std::string& title = "");

  // Unplayed items only.
  PlaylistError Remove(int64_t item_id);

  // Drops every unplayed item; played history is kept. Returns count removed.
  size_t Clear();

  // All items in position order.
  std::vector<PlaylistItem> List() const;

  // Next unplayed item by position. Does not mark it played.
  ItemResult Advance() const;

  PlaylistError MarkPlayed(int64_t item_id);

  // Paths of unplayed items in position order (manifest input).
  std::vector<std::string> UnplayedPaths() const;

  size_t UnplayedCount() const;

 private:
  mutable std::mutex mutex_;
  std::vector<PlaylistItem> items_;
  int64_t next_item_id_ = 1;
  int32_t next_position_ = 1;
};

}  // namespace onair::playlist

#endif  // ONAIR_PLAYLIST_PLAYLIST_QUEUE_HPP_
