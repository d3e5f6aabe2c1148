#include "MpiExchange.hpp"

namespace MpiExchange {

namespace {

void broadcastPairs(std::vector<long long>& times, std::vector<double>& values,
                    int root, MPI_Comm comm) {
  int n = static_cast<int>(times.size());
  MPI_Bcast(&n, 1, MPI_INT, root, comm);
  times.resize(static_cast<std::size_t>(n));
  values.resize(static_cast<std::size_t>(n));
  if (n == 0) return;
  MPI_Bcast(times.data(), n, MPI_LONG_LONG, root, comm);
  MPI_Bcast(values.data(), n, MPI_DOUBLE, root, comm);
}

} // namespace

void broadcastPrices(std::vector<PricePoint>& points, int root, MPI_Comm comm) {
  std::vector<long long> times;
  std::vector<double> values;
  for (const auto& p : points) {
    times.push_back(static_cast<long long>(p.time));
    values.push_back(p.price);
  }
  broadcastPairs(times, values, root, comm);

  points.clear();
  for (std::size_t i = 0; i < times.size(); ++i) {
    points.push_back({static_cast<Timestamp>(times[i]), values[i]});
  }
}

void broadcastSeries(std::map<Timestamp, double>& series, int root, MPI_Comm comm) {
  std::vector<long long> times;
  std::vector<double> values;
  for (const auto& kv : series) {
    times.push_back(static_cast<long long>(kv.first));
    values.push_back(kv.second);
  }
  broadcastPairs(times, values, root, comm);

  series.clear();
  for (std::size_t i = 0; i < times.size(); ++i) {
    series[static_cast<Timestamp>(times[i])] = values[i];
  }
}

Totals reduceTotals(const Totals& local, int root, MPI_Comm comm) {
  double in[6] = {local.settledSavings, local.openSavings, local.planCost,
                  local.zones, local.degradedZones, local.commands};
  double out[6] = {0, 0, 0, 0, 0, 0};
  MPI_Reduce(in, out, 6, MPI_DOUBLE, MPI_SUM, root, comm);

  int rank = 0;
  MPI_Comm_rank(comm, &rank);
  if (rank != root) return local;

  Totals t;
  t.settledSavings = out[0];
  t.openSavings    = out[1];
  t.planCost       = out[2];
  t.zones          = out[3];
  t.degradedZones  = out[4];
  t.commands       = out[5];
  return t;
}

} // namespace MpiExchange
