#pragma once
#include <mpi.h>
#include <map>
#include <vector>
#include "PriceCurve.hpp"

// Rank-0 inputs out to every rank, per-rank results back to rank 0.
namespace MpiExchange {

void broadcastPrices(std::vector<PricePoint>& points, int root, MPI_Comm comm);
void broadcastSeries(std::map<Timestamp, double>& series, int root, MPI_Comm comm);

struct Totals {
  double settledSavings = 0.0;
  double openSavings    = 0.0;
  double planCost       = 0.0;
  double zones          = 0.0;
  double degradedZones  = 0.0;
  double commands       = 0.0;
};

// Element-wise sum on root; other ranks get their input back.
Totals reduceTotals(const Totals& local, int root, MPI_Comm comm);

} // namespace MpiExchange
