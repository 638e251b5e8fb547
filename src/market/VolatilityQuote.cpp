#include <fxvol/market/VolatilityQuote.h>
#include <fxvol/utils/Utils.h>

int deltaValue(DeltaBucket bucket)
{
    switch (bucket) {
        case DeltaBucket::D5:  return 5;
        case DeltaBucket::D10: return 10;
        case DeltaBucket::D15: return 15;
        case DeltaBucket::D25: return 25;
        case DeltaBucket::D35: return 35;
    }
    return 0;
}

std::optional<double> BidAsk::mid() const
{
    return Utils::mid(bid, ask);
}

void VolatilityQuote::forEachField(
    const std::function<void(const std::string&, const std::optional<double>&)>& visitor) const
{
    visitor("atm_bid", atm.bid);
    visitor("atm_ask", atm.ask);
    for (DeltaBucket bucket : ALL_DELTA_BUCKETS) {
        const std::string d = std::to_string(deltaValue(bucket)) + "d";
        visitor("rr_" + d + "_bid", riskReversal(bucket).bid);
        visitor("rr_" + d + "_ask", riskReversal(bucket).ask);
        visitor("bf_" + d + "_bid", butterfly(bucket).bid);
        visitor("bf_" + d + "_ask", butterfly(bucket).ask);
    }
}

std::optional<double> SecurityData::field(const std::string& name) const
{
    auto it = fields.find(name);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SecurityData::hasField(const std::string& name) const
{
    return field(name).has_value();
}
