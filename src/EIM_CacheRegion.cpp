//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_CacheRegion.hpp"

#include "EIM_Exceptions.hpp"

#include "Teuchos_VerboseObject.hpp"
#include "Teuchos_TestForException.hpp"

#include <limits>

namespace EIM {

bool operator<(const CacheKey &a, const CacheKey &b)
{
  return (a.owner < b.owner) || (a.owner == b.owner && a.index < b.index);
}

bool operator==(const CacheKey &a, const CacheKey &b)
{
  return a.owner == b.owner && a.index == b.index;
}

MemoryCacheRegion::MemoryCacheRegion(int maxKeys) :
  maxKeys_(maxKeys),
  values_(),
  insertionOrder_()
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      maxKeys_ == 0 || maxKeys_ < -1,
      ConfigurationError,
      "Invalid cache key limit " << maxKeys_ << " (expected a positive value or -1 for no limit)");
}

void
MemoryCacheRegion::clear()
{
  values_.clear();
  insertionOrder_.clear();
}

Teuchos::RCP<const VectorArray>
MemoryCacheRegion::get(const CacheKey &key) const
{
  const ValueMap::const_iterator it = values_.find(key);
  return (it != values_.end()) ? it->second : Teuchos::null;
}

void
MemoryCacheRegion::set(const CacheKey &key, const Teuchos::RCP<const VectorArray> &value)
{
  const ValueMap::iterator it = values_.lower_bound(key);
  if (it != values_.end() && it->first == key) {
    const Teuchos::RCP<Teuchos::FancyOStream> out = Teuchos::VerboseObjectBase::getDefaultOStream();
    *out << "Warning: key (" << key.owner << ", " << key.index << ") already present in cache region, ignoring\n";
    return;
  }

  values_.insert(it, std::make_pair(key, value));
  insertionOrder_.push_back(key);

  if (maxKeys_ != -1 && this->size() > maxKeys_) {
    values_.erase(insertionOrder_.front());
    insertionOrder_.pop_front();
  }
}

void
MemoryCacheRegion::removeOwner(const std::string &owner)
{
  ValueMap::iterator it = values_.lower_bound(CacheKey(owner, std::numeric_limits<int>::min()));
  while (it != values_.end() && it->first.owner == owner) {
    values_.erase(it++);
  }

  std::deque<CacheKey>::iterator last = insertionOrder_.begin();
  for (std::deque<CacheKey>::iterator key = insertionOrder_.begin(); key != insertionOrder_.end(); ++key) {
    if (key->owner != owner) {
      *last++ = *key;
    }
  }
  insertionOrder_.erase(last, insertionOrder_.end());
}

CacheRegionRepository::CacheRegionRepository()
{
  // Nothing to do
}

Teuchos::RCP<CacheRegion>
CacheRegionRepository::get(const std::string &name) const
{
  if (name == "none") {
    return Teuchos::null;
  }

  const RegionMap::const_iterator it = regions_.find(name);
  TEUCHOS_TEST_FOR_EXCEPTION(
      it == regions_.end(),
      ConfigurationError,
      name << " is not a valid cache region.");

  return it->second;
}

void
CacheRegionRepository::extend(const std::string &name, const Teuchos::RCP<CacheRegion> &region)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      name == "none",
      ConfigurationError,
      "The cache region name none is reserved");
  TEUCHOS_TEST_FOR_EXCEPT(Teuchos::is_null(region));
  regions_[name] = region;
}

Teuchos::RCP<CacheRegionRepository> defaultCacheRegions()
{
  static Teuchos::RCP<CacheRegionRepository> instance;
  if (Teuchos::is_null(instance)) {
    instance = Teuchos::rcp(new CacheRegionRepository);
    instance->extend("memory", Teuchos::rcp(new MemoryCacheRegion));
  }
  return instance;
}

} // namespace EIM
