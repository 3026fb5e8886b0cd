#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <random>
#include <fstream>
#include <iostream>

// Writes a CSV with known data-quality problems, one per column:
//   id        unique integers              -> identifier_like
//   amount    N(100, 15), 1 in 1000 x50    -> extreme_outliers
//   region    4 categories, 12% empty      -> missing_values (warning)
//   flag      true/false                   -> ok
//   version   always "v1"                  -> near_constant
//   score     floats, 1 in 20 is "n/a?"    -> mixed_type
int main(int argc, char** argv){
  if (argc < 3){
    std::cerr << "usage: csvdx_gen_synth_csv <out.csv> <rows> [seed]\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
  const std::uint64_t seed = argc > 3 ? std::strtoull(argv[3], nullptr, 10) : 42;

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  f << "id,amount,region,flag,version,score\n";

  std::mt19937_64 rng(seed);
  std::normal_distribution<double> amount(100.0, 15.0);
  std::uniform_real_distribution<double> score(0.0, 1.0);
  std::uniform_int_distribution<int> pct(0, 99);
  const char* regions[] = {"north","south","east","west"};

  char buf[64];
  for (std::uint64_t i=1;i<=rows;++i){
    f << i << ",";

    double a = amount(rng);
    if (i % 1000 == 0) a *= 50.0;
    std::snprintf(buf, sizeof(buf), "%.2f", a);
    f << buf << ",";

    if (pct(rng) >= 12) f << regions[i % 4];
    f << ",";

    f << ((i % 3) == 0 ? "true" : "false") << ",";
    f << "v1,";

    if (i % 20 == 0) f << "n/a?";
    else { std::snprintf(buf, sizeof(buf), "%.4f", score(rng)); f << buf; }
    f << "\n";
  }
  std::cerr << "wrote " << rows << " rows to " << out << "\n";
  return 0;
}
