#pragma once

#include <easepath/converter.hpp>
#include <easepath/ease.hpp>
#include <easepath/keyframe_source.hpp>
#include <easepath/logger.hpp>
#include <easepath/path.hpp>

// ─── Quick start ─────────────────────────────────────────────────────────────
//
//   easepath::KeyframeTrack track("Opacity", 30.0);
//   track.add_keyframe(0.0, 0.0, IT::Linear, IT::Bezier, {}, {0.0, 33.3});
//   track.add_keyframe(0.8, 100.0, IT::Bezier, IT::Linear, {0.0, 75.0}, {});
//
//   easepath::EasePathConverter converter;
//   if (auto r = converter.convert(track))
//       std::cout << r->text;   // M0.0000,0.0000C7.9920,0.0000,...
