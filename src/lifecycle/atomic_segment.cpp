#include "lifecycle/atomic_segment.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/interprocess/creation_tags.hpp>
#include <boost/interprocess/exceptions.hpp>

#include "common/constants.hpp"
#include "common/logging.hpp"

namespace whiz::lifecycle {

namespace bip = boost::interprocess;

auto SegmentNames::forApp(const std::string& app_name) -> SegmentNames {
  return SegmentNames{app_name + constants::kSegmentSuffix,
                      app_name + constants::kSemaphoreSuffix};
}

AtomicSegment::CriticalSection::~CriticalSection() {
  if (semaphore_ != nullptr) {
    semaphore_->post();
  }
}

auto AtomicSegment::open(const SegmentNames& names)
    -> SegmentResult<std::unique_ptr<AtomicSegment>> {
  try {
    auto semaphore = std::make_unique<bip::named_semaphore>(
        bip::open_or_create, names.semaphore.c_str(), 1);
    LOG_MODULE("instance_lock", DEBUG)
        << "Opened semaphore " << names.semaphore;
    return std::make_unique<AtomicSegment>(Key{}, names, std::move(semaphore));
  } catch (const bip::interprocess_exception& ex) {
    LOG_MODULE("instance_lock", WARNING)
        << "Cannot open semaphore " << names.semaphore << ": " << ex.what();
    return tl::make_unexpected(
        SegmentError{"Cannot open semaphore: " + std::string(ex.what())});
  }
}

AtomicSegment::AtomicSegment(Key /*key*/, SegmentNames names,
                             std::unique_ptr<bip::named_semaphore> semaphore)
    : names_(std::move(names)), semaphore_(std::move(semaphore)) {}

AtomicSegment::~AtomicSegment() {
  if (owns()) {
    auto result = detach();
    if (!result) {
      LOG_MODULE("instance_lock", WARNING) << result.error().message;
    }
  }
}

auto AtomicSegment::enter(std::chrono::milliseconds timeout)
    -> SegmentResult<CriticalSection> {
  try {
    const auto deadline = boost::posix_time::microsec_clock::universal_time() +
                          boost::posix_time::milliseconds(timeout.count());
    if (!semaphore_->timed_wait(deadline)) {
      return tl::make_unexpected(SegmentError{
          "Timed out waiting for semaphore " + names_.semaphore});
    }
    return CriticalSection(semaphore_.get());
  } catch (const bip::interprocess_exception& ex) {
    return tl::make_unexpected(
        SegmentError{"Semaphore wait failed: " + std::string(ex.what())});
  }
}

auto AtomicSegment::create() -> SegmentResult<CreateOutcome> {
  if (owns()) {
    return CreateOutcome::Created;
  }
  try {
    segment_ = std::make_unique<bip::shared_memory_object>(
        bip::create_only, names_.segment.c_str(), bip::read_write);
    LOG_MODULE("instance_lock", DEBUG) << "Created segment " << names_.segment;
    return CreateOutcome::Created;
  } catch (const bip::interprocess_exception& ex) {
    if (ex.get_error_code() == bip::already_exists_error) {
      return CreateOutcome::AlreadyExists;
    }
    return tl::make_unexpected(SegmentError{
        "Cannot create segment " + names_.segment + ": " + ex.what()});
  }
}

auto AtomicSegment::removeOrphan() -> bool {
  const bool removed = bip::shared_memory_object::remove(names_.segment.c_str());
  LOG_MODULE("instance_lock", INFO)
      << "Removed orphaned segment " << names_.segment
      << (removed ? "" : " (nothing to remove)");
  return removed;
}

auto AtomicSegment::detach() -> SegmentResult<void> {
  if (!owns()) {
    return {};
  }
  segment_.reset();
  if (!bip::shared_memory_object::remove(names_.segment.c_str())) {
    return tl::make_unexpected(
        SegmentError{"Failed to remove segment " + names_.segment});
  }
  LOG_MODULE("instance_lock", DEBUG) << "Removed segment " << names_.segment;
  return {};
}

void AtomicSegment::abandon() {
  if (owns()) {
    segment_.reset();
    LOG_MODULE("instance_lock", DEBUG)
        << "Closed segment " << names_.segment << " without removing it";
  }
}

void AtomicSegment::forceRemove(const SegmentNames& names) {
  const bool segment_removed =
      bip::shared_memory_object::remove(names.segment.c_str());
  const bool semaphore_removed =
      bip::named_semaphore::remove(names.semaphore.c_str());
  LOG_MODULE("instance_lock", INFO)
      << "Force removal: segment " << (segment_removed ? "removed" : "absent")
      << ", semaphore " << (semaphore_removed ? "removed" : "absent");
}

}  // namespace whiz::lifecycle
