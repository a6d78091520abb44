#pragma once

//
// Memoization seam for the generators. The core never owns a cache, callers hand one in and decide
// about its capacity, eviction and thread safety.
//
namespace tint {

struct CacheKey
{
  char text[96] = {};
};

template <typename Value> class Cache
{
public:
  virtual ~Cache()                                         = default;
  virtual bool Lookup(const CacheKey& key, Value& out)     = 0;
  virtual void Store(const CacheKey& key, const Value& in) = 0;
};

} // namespace tint
