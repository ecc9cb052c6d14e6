//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_CACHEREGION_HPP
#define EIM_CACHEREGION_HPP

#include "EIM_VectorArray.hpp"

#include "Teuchos_RCP.hpp"

#include <string>
#include <map>
#include <deque>

namespace EIM {

// Identifies a cached value: the identity of its producer and an index
struct CacheKey {
  CacheKey(const std::string &owner_in, int index_in) :
    owner(owner_in),
    index(index_in)
  {}

  std::string owner;
  int index;
};

bool operator<(const CacheKey &a, const CacheKey &b);
bool operator==(const CacheKey &a, const CacheKey &b);

class CacheRegion {
public:
  // Null when key is absent
  virtual Teuchos::RCP<const VectorArray> get(const CacheKey &key) const = 0;
  virtual void set(const CacheKey &key, const Teuchos::RCP<const VectorArray> &value) = 0;

  // Drops every key of owner
  virtual void removeOwner(const std::string &owner) = 0;

  virtual ~CacheRegion() {}

protected:
  CacheRegion() {}

private:
  // Disallow copy and assignment
  CacheRegion(const CacheRegion &);
  CacheRegion &operator=(const CacheRegion &);
};

// In-memory region. With a key limit, inserting a new key beyond the limit evicts
// the oldest key. Setting a key that is already present is ignored.
class MemoryCacheRegion : public CacheRegion {
public:
  // maxKeys is positive, or -1 for no limit
  explicit MemoryCacheRegion(int maxKeys = -1);

  int size() const { return values_.size(); }
  int maxKeys() const { return maxKeys_; }
  void clear();

  virtual Teuchos::RCP<const VectorArray> get(const CacheKey &key) const;
  virtual void set(const CacheKey &key, const Teuchos::RCP<const VectorArray> &value);
  virtual void removeOwner(const std::string &owner);

private:
  int maxKeys_;

  typedef std::map<CacheKey, Teuchos::RCP<const VectorArray> > ValueMap;
  ValueMap values_;
  std::deque<CacheKey> insertionOrder_;
};

// Named cache regions. The name "none" is reserved and disables caching.
class CacheRegionRepository {
public:
  CacheRegionRepository();

  // Null for "none", throws ConfigurationError for an unknown name
  Teuchos::RCP<CacheRegion> get(const std::string &name) const;

  void extend(const std::string &name, const Teuchos::RCP<CacheRegion> &region);

private:
  typedef std::map<std::string, Teuchos::RCP<CacheRegion> > RegionMap;
  RegionMap regions_;
};

// Process-wide repository holding the unlimited "memory" region
Teuchos::RCP<CacheRegionRepository> defaultCacheRegions();

} // namespace EIM

#endif /* EIM_CACHEREGION_HPP */
