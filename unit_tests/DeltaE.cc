#define SDL_MAIN_HANDLED
#include "../sources/tint/delta_e.hh"
#include <SDL2/SDL.h>

using namespace tint;

namespace {

bool near(double expected, double actual, double epsilon)
{
  return SDL_fabs(expected - actual) <= epsilon;
}

const uint32_t palette[] = {0x1890FF, 0xFF0000, 0x00B96B, 0xFAAD14, 0x722ED1, 0x000000,
                            0xFFFFFF, 0x777777, 0x010203, 0xFEFEFE, 0x808000, 0xC81E96};

const DeltaEAlgorithm algorithms[] = {DeltaEAlgorithm::CIE76, DeltaEAlgorithm::CIE94, DeltaEAlgorithm::CIEDE2000,
                                      DeltaEAlgorithm::CMC, DeltaEAlgorithm::OKLAB};

void identity()
{
  for (uint32_t hex : palette)
  {
    const Color color = Color::from_hex(hex);
    for (DeltaEAlgorithm algorithm : algorithms)
    {
      DeltaEOptions options;
      options.algorithm = algorithm;
      SDL_assert(0.0 == delta_e(color, color, options));
    }

    SDL_assert(0.0 == delta_e_94(color, color, Cie94Application::Textiles));
  }
}

void symmetry()
{
  for (uint32_t a : palette)
  {
    for (uint32_t b : palette)
    {
      const Color lhs = Color::from_hex(a);
      const Color rhs = Color::from_hex(b);
      SDL_assert(near(delta_e_2000(lhs, rhs), delta_e_2000(rhs, lhs), 1e-9));
      SDL_assert(near(delta_e_76(lhs, rhs), delta_e_76(rhs, lhs), 1e-9));
      SDL_assert(near(delta_e_oklab(lhs, rhs), delta_e_oklab(rhs, lhs), 1e-9));
    }
  }
}

void known_distances()
{
  const Color black = Color::from_hex(0x000000);
  const Color white = Color::from_hex(0xFFFFFF);

  SDL_assert(near(100.0, delta_e_76(black, white), 0.05));
  SDL_assert(near(100.0, delta_e_2000(black, white), 0.05));
  SDL_assert(near(100.0, delta_e_94(black, white), 0.05));
  SDL_assert(near(1.0, delta_e_oklab(black, white), 1e-3));

  const Color red  = Color::from_hex(0xFF0000);
  const Color blue = Color::from_hex(0x0000FF);
  SDL_assert(delta_e_2000(red, blue) > 10.0);
  SDL_assert(delta_e_cmc(red, blue) > 10.0);

  // one step on a single channel is below the noticeable difference
  const Color seed    = Color::from_hex(0x1890FF);
  const Color shifted = Color::from_hex(0x1891FF);
  SDL_assert(delta_e_2000(seed, shifted) < 1.0);
  SDL_assert(not are_colors_distinguishable(seed, shifted));
  SDL_assert(are_colors_distinguishable(red, blue));
}

void bands_and_similarity()
{
  SDL_assert(DifferenceBand::Identical == classify_difference(0.0));
  SDL_assert(DifferenceBand::Imperceptible == classify_difference(0.5));
  SDL_assert(DifferenceBand::BarelyPerceptible == classify_difference(1.5));
  SDL_assert(DifferenceBand::Visible == classify_difference(5.0));
  SDL_assert(DifferenceBand::Visible == classify_difference(10.0));
  SDL_assert(DifferenceBand::Distinct == classify_difference(10.5));
  SDL_assert(0 == SDL_strcmp("barely perceptible", to_string(DifferenceBand::BarelyPerceptible)));

  const Color           seed      = Color::from_hex(0x1890FF);
  const ColorSimilarity identical = color_similarity(seed, seed);
  SDL_assert(1.0 == identical.similarity);
  SDL_assert(0.0 == identical.delta_e);
  SDL_assert(not identical.perceptible);
  SDL_assert(DeltaEAlgorithm::CIEDE2000 == identical.algorithm);

  DeltaEOptions         options;
  options.algorithm           = DeltaEAlgorithm::CIE76;
  const ColorSimilarity apart = color_similarity(Color::from_hex(0x000000), Color::from_hex(0xFFFFFF), options);
  SDL_assert(apart.perceptible);
  SDL_assert(near(SDL_exp(-apart.delta_e / 10.0), apart.similarity, 1e-12));
  SDL_assert(apart.similarity < 0.001);

  SDL_assert(2.3 == jnd_threshold(DeltaEAlgorithm::CIEDE2000));
  SDL_assert(2.5 == jnd_threshold(DeltaEAlgorithm::CIE94));
  SDL_assert(2.3 == jnd_threshold(DeltaEAlgorithm::OKLAB));

  DeltaEAlgorithm algorithm = DeltaEAlgorithm::CIE76;
  SDL_assert(parse_delta_e_algorithm("CMC", algorithm));
  SDL_assert(DeltaEAlgorithm::CMC == algorithm);
  SDL_assert(parse_delta_e_algorithm("2000", algorithm));
  SDL_assert(DeltaEAlgorithm::CIEDE2000 == algorithm);
  SDL_assert(not parse_delta_e_algorithm("2001", algorithm));
  SDL_assert(DeltaEAlgorithm::CIEDE2000 == algorithm);
}

void nearest()
{
  const Color              target     = Color::from_hex(0xFF0000);
  const std::vector<Color> candidates = {Color::from_hex(0x0000FF), Color::from_hex(0xFE0000),
                                         Color::from_hex(0x00FF00), Color::from_hex(0xFF0000)};

  NearestColor result = {};
  SDL_assert(Status::Ok == find_nearest_color(target, candidates, DeltaEOptions(), result));
  SDL_assert(3 == result.index);
  SDL_assert(0.0 == result.delta_e);

  SDL_assert(Status::ArgumentError == find_nearest_color(target, {}, DeltaEOptions(), result));

  const std::vector<NearestColor> closest = find_nearest_colors(target, candidates, 2);
  SDL_assert(2 == closest.size());
  SDL_assert(3 == closest[0].index);
  SDL_assert(1 == closest[1].index);
  SDL_assert(closest[0].delta_e <= closest[1].delta_e);

  // equal distances keep their input order
  const std::vector<Color>        twins = {Color::from_hex(0x00FF00), Color::from_hex(0x00FF00)};
  const std::vector<NearestColor> tied  = find_nearest_colors(target, twins);
  SDL_assert(2 == tied.size());
  SDL_assert(0 == tied[0].index);
  SDL_assert(1 == tied[1].index);
}

void matrix()
{
  std::vector<Color> colors;
  for (uint32_t hex : palette)
    colors.push_back(Color::from_hex(hex));

  const DistanceMatrix distances = color_distance_matrix(colors);
  SDL_assert(colors.size() == distances.size);
  SDL_assert(distances.size * distances.size == distances.values.size());

  for (uint32_t i = 0; i < distances.size; ++i)
  {
    SDL_assert(0.0 == distances.at(i, i));
    for (uint32_t j = 0; j < distances.size; ++j)
      SDL_assert(distances.at(i, j) == distances.at(j, i));
  }

  SDL_assert(near(delta_e_2000(colors[0], colors[1]), distances.at(0, 1), 1e-12));
}

void diversity()
{
  const std::vector<Color> twins      = {Color::from_hex(0x1890FF), Color::from_hex(0x1890FF)};
  const PaletteDiversity   no_variety = analyze_palette_diversity(twins);
  SDL_assert(0.0 == no_variety.diversity_score);
  SDL_assert(0.0 == no_variety.average_delta_e);
  SDL_assert(0.0 == no_variety.distinguishable_percentage);
  SDL_assert(1 == no_variety.cluster_count);

  const PaletteDiversity single = analyze_palette_diversity({Color::from_hex(0x1890FF)});
  SDL_assert(0.0 == single.diversity_score);
  SDL_assert(1 == single.cluster_count);

  const std::vector<Color> spread = {Color::from_hex(0x000000), Color::from_hex(0xFFFFFF),
                                     Color::from_hex(0xFF0000)};
  const PaletteDiversity   varied = analyze_palette_diversity(spread);
  SDL_assert(3 == varied.cluster_count);
  SDL_assert(100.0 == varied.distinguishable_percentage);
  SDL_assert(varied.min_delta_e <= varied.average_delta_e);
  SDL_assert(varied.average_delta_e <= varied.max_delta_e);
  SDL_assert(0.0 < varied.diversity_score);
  SDL_assert(1.0 >= varied.diversity_score);

  // two near duplicates collapse into one perceptual group
  const std::vector<Color> pairs   = {Color::from_hex(0x1890FF), Color::from_hex(0x1891FF),
                                      Color::from_hex(0xFF0000), Color::from_hex(0xFE0000)};
  const PaletteDiversity   grouped = analyze_palette_diversity(pairs);
  SDL_assert(2 == grouped.cluster_count);
}

} // namespace

int main()
{
  SDL_Log("identity");
  identity();
  SDL_Log("symmetry");
  symmetry();
  SDL_Log("known distances");
  known_distances();
  SDL_Log("bands and similarity");
  bands_and_similarity();
  SDL_Log("nearest");
  nearest();
  SDL_Log("matrix");
  matrix();
  SDL_Log("diversity");
  diversity();
  SDL_Log("DeltaE OK");
  return 0;
}
