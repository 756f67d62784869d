///// Otter: Scanline/Phosphor-Burn Post-Pass – FSQ samplet das Composite-Target.
///// Schneefuchs: Uniform-Namen sind Vertrag mit GlGraphicsDevice (screenSize, screenBurn, screenBurnColor).
///// Maus: Nahezu schwarze Pixel gluehen bei screenBurn in der Burn-Farbe nach, mittig staerker.
///// Datei: post_shaders.hpp

#pragma once
// Header-only: haelt nur GLSL-Quellen zusammen.

namespace kachel::PostShaders {

inline constexpr const char* ScanlinesVS = R"GLSL(#version 430 core
layout(location=0) in vec2 aPos; layout(location=1) in vec2 aTex;
out vec2 vTex;
void main(){ vTex = aTex; gl_Position = vec4(aPos, 0.0, 1.0); }
)GLSL";

inline constexpr const char* ScanlinesFS = R"GLSL(#version 430 core
in vec2 vTex; out vec4 FragColor;
uniform sampler2D screenTexture;
uniform vec3  screenSize;
uniform bool  screenBurn;
uniform vec3  screenBurnColor;

void main(){
  vec3 col = texture(screenTexture, vTex).rgb;
  float scan = mod(floor(gl_FragCoord.y), 2.0) * 0.25;
  vec3 scanColor = max(col - vec3(scan), vec3(0.0));

  if (col.r < 0.1 && col.g < 0.1 && col.b < 0.1) {
    if (screenBurn) {
      vec2 uv = gl_FragCoord.xy / max(screenSize.xy, vec2(1.0));
      float glow = (1.0 - distance(uv, vec2(0.5))) * 0.2;
      FragColor = vec4(screenBurnColor * glow, 1.0);
    } else {
      FragColor = vec4(0.0, 0.0, 0.0, 1.0);
    }
  } else {
    FragColor = vec4(scanColor, 1.0);
  }
}
)GLSL";

} // namespace kachel::PostShaders
