#include "AdminPage.h"

namespace mockprom {

const char* admin_page_html() {
    return R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>Prometheus Mock - Scenario Control</title>
<style>
body { font-family: sans-serif; max-width: 720px; margin: 2em auto; color: #222; }
button { margin: 0.25em; padding: 0.5em 1em; }
pre { background: #f4f4f4; padding: 1em; }
.active { font-weight: bold; }
</style>
</head>
<body>
<h1>Prometheus Mock</h1>
<p>Select a scenario. Switching restarts its progression timer.</p>
<div id="scenarios"></div>
<p><button onclick="resetTimer()">Reset timer</button></p>
<h2>Current status</h2>
<pre id="status">loading...</pre>
<script>
async function refresh() {
  const r = await fetch('/prometheus/api/scenario');
  const j = await r.json();
  document.getElementById('status').textContent = JSON.stringify(j.data, null, 2);
  document.querySelectorAll('#scenarios button').forEach(b => {
    b.className = (b.dataset.type === j.data.type) ? 'active' : '';
  });
}
async function setScenario(t) {
  await fetch('/prometheus/api/scenario', {
    method: 'POST', headers: {'Content-Type': 'application/json'},
    body: JSON.stringify({scenario: t})
  });
  refresh();
}
async function resetTimer() {
  await fetch('/prometheus/api/scenario/reset', {method: 'POST'});
  refresh();
}
async function load() {
  const r = await fetch('/prometheus/api/scenarios');
  const j = await r.json();
  const div = document.getElementById('scenarios');
  j.data.forEach(s => {
    const b = document.createElement('button');
    b.dataset.type = s.type;
    b.title = s.description;
    b.textContent = s.type;
    b.onclick = () => setScenario(s.type);
    div.appendChild(b);
  });
  refresh();
  setInterval(refresh, 5000);
}
load();
</script>
</body>
</html>
)HTML";
}

}
