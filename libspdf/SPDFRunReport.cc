#include <spdf/SPDFRunReport.hh>

#include <mutex>
#include <stdexcept>

class SPDFRunReport::Members
{
  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members() = default;

    mutable std::mutex lock;
    std::vector<SPDFItemReport> items;
};

char const*
SPDFItemReport::statusName(status_e status)
{
    switch (status) {
    case is_pending:
        return "pending";
    case is_in_progress:
        return "in progress";
    case is_skipped:
        return "skipped";
    case is_failed:
        return "failed";
    case is_succeeded:
        return "succeeded";
    }
    throw std::logic_error("SPDFItemReport: invalid status");
}

SPDFRunReport::SPDFRunReport() :
    m(new Members())
{
}

void
SPDFRunReport::add(SPDFItemReport const& item)
{
    std::lock_guard<std::mutex> guard(m->lock);
    m->items.push_back(item);
}

std::vector<SPDFItemReport>
SPDFRunReport::getItems() const
{
    std::lock_guard<std::mutex> guard(m->lock);
    return m->items;
}

size_t
SPDFRunReport::count(SPDFItemReport::status_e status) const
{
    std::lock_guard<std::mutex> guard(m->lock);
    size_t result = 0;
    for (auto const& item: m->items) {
        if (item.status == status) {
            ++result;
        }
    }
    return result;
}

bool
SPDFRunReport::hasFailures() const
{
    return count(SPDFItemReport::is_failed) > 0;
}

void
SPDFRunReport::writeSummary(SPDFLogger& logger) const
{
    auto items = getItems();
    logger.info(
        "Summary: " + std::to_string(items.size()) + " file(s), " +
        std::to_string(count(SPDFItemReport::is_succeeded)) + " succeeded, " +
        std::to_string(count(SPDFItemReport::is_skipped)) + " skipped, " +
        std::to_string(count(SPDFItemReport::is_failed)) + " failed");
    for (auto const& item: items) {
        if (item.status == SPDFItemReport::is_skipped) {
            logger.info("  skipped " + item.item.input + ": " + item.reason);
        } else if (item.status == SPDFItemReport::is_failed) {
            logger.info("  failed " + item.item.input + ": " + item.reason);
        }
    }
}
